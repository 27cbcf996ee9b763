//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include "src/detail/log.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace boost::nbtls::detail {

namespace {

constexpr char const* logger_name = "nbtls";

std::shared_ptr<spdlog::logger>
make_logger()
{
    auto logger = spdlog::get( logger_name );
    if( logger )
        return logger;

    logger = spdlog::stderr_color_mt( logger_name );
    logger->set_level( spdlog::level::warn );

    // SPDLOG_LEVEL overrides the default
    spdlog::cfg::load_env_levels();
    return logger;
}

} // namespace

spdlog::logger&
log()
{
    static std::shared_ptr<spdlog::logger> const logger = make_logger();
    return *logger;
}

} // namespace boost::nbtls::detail
