//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef SRC_DETAIL_MAKE_ERR_HPP
#define SRC_DETAIL_MAKE_ERR_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace boost::nbtls::detail {

/** Convert a POSIX errno value to system::error_code.

    @param errn The errno value.
    @return The corresponding system::error_code.
*/
system::error_code make_err(int errn) noexcept;

/** Convert a getaddrinfo result to system::error_code.

    @param gai The value returned by getaddrinfo.
    @return The corresponding system::error_code.
*/
system::error_code make_gai_err(int gai) noexcept;

} // namespace boost::nbtls::detail

#endif
