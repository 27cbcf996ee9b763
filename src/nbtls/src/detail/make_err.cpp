//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include "src/detail/make_err.hpp"

#include <boost/system/error_code.hpp>

#include <errno.h>
#include <netdb.h>

namespace boost::nbtls::detail {

system::error_code
make_err(int errn) noexcept
{
    if (errn == 0)
        return {};

    return system::error_code(errn, system::system_category());
}

system::error_code
make_gai_err(int gai) noexcept
{
    switch (gai)
    {
    case 0:
        return {};
    case EAI_SYSTEM:
        return make_err(errno);
    case EAI_MEMORY:
        return make_err(ENOMEM);
    case EAI_AGAIN:
        return make_err(EAGAIN);
    default:
        return make_err(EHOSTUNREACH);
    }
}

} // namespace boost::nbtls::detail
