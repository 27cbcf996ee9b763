//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef SRC_DETAIL_LOG_HPP
#define SRC_DETAIL_LOG_HPP

#include <boost/nbtls/detail/config.hpp>

#include <spdlog/spdlog.h>

namespace boost::nbtls::detail {

/** Return the library's logger.

    The logger is named "nbtls" and is registered with spdlog
    on first use, so applications can retrieve it with
    `spdlog::get( "nbtls" )` to change its sinks. The level
    defaults to `warn` and can be set through the `SPDLOG_LEVEL`
    environment variable, for example `SPDLOG_LEVEL=nbtls=trace`.
*/
BOOST_NBTLS_DECL
spdlog::logger&
log();

} // namespace boost::nbtls::detail

#endif
