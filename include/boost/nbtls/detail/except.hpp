//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_DETAIL_EXCEPT_HPP
#define BOOST_NBTLS_DETAIL_EXCEPT_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace boost {
namespace nbtls {
namespace detail {

/** Throw a logic_error exception.

    Used to report misuse of a pollable object, such as
    stepping a handshake after its result was delivered.

    @param what The message describing the misuse.
    @param loc Source location for diagnostics.
*/
BOOST_NBTLS_DECL void BOOST_NORETURN throw_logic_error(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

/** Throw a system_error exception.

    @note Callers should check `ec.failed()` before calling this function.

    @param ec The error code to throw.
    @param loc Source location for diagnostics.
*/
BOOST_NBTLS_DECL void BOOST_NORETURN throw_system_error(
    system::error_code const& ec,
    source_location const& loc = BOOST_CURRENT_LOCATION);

/** Throw a system_error exception with context.

    @param ec The error code to throw.
    @param what Context string describing the operation that failed.
    @param loc Source location for diagnostics.
*/
BOOST_NBTLS_DECL void BOOST_NORETURN throw_system_error(
    system::error_code const& ec,
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // nbtls
} // boost

#endif
