//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_ERROR_HPP
#define BOOST_NBTLS_ERROR_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/system/error_code.hpp>

#include <type_traits>

namespace boost::nbtls {

/** Error codes returned by the library.

    Engines report their own diagnostics through their own
    categories. Transports report operating system errors
    unchanged.
*/
enum class error
{
    /// The byte stream ended.
    ///
    /// Returned by a transport when the peer closed its end, and
    /// by a secure stream when the peer sent close-notify.
    eof = 1,

    /// The transport ended without the peer sending close-notify.
    stream_truncated,

    /// The engine could not create a session from the configuration.
    setup_failed
};

/** Error conditions for classifying failures.

    Compare an error code against these to find out which
    layer ended an operation, regardless of the engine.

    @par Example
    @code
    if( r.error() == nbtls::condition::transport_failure )
        reconnect();
    @endcode
*/
enum class condition
{
    /// The engine rejected the configuration or could not
    /// allocate a session.
    setup_failure = 1,

    /// The engine reported a handshake, certificate, or record
    /// layer failure.
    protocol_failure,

    /// The underlying transport reported an error.
    transport_failure
};

BOOST_NBTLS_DECL
system::error_category const&
get_error_category() noexcept;

BOOST_NBTLS_DECL
system::error_category const&
get_condition_category() noexcept;

inline
system::error_code
make_error_code( error e ) noexcept
{
    return system::error_code(
        static_cast<int>( e ), get_error_category() );
}

inline
system::error_condition
make_error_condition( condition c ) noexcept
{
    return system::error_condition(
        static_cast<int>( c ), get_condition_category() );
}

} // namespace boost::nbtls

namespace boost::system {

template<>
struct is_error_code_enum<nbtls::error>
    : std::true_type
{
};

template<>
struct is_error_condition_enum<nbtls::condition>
    : std::true_type
{
};

} // namespace boost::system

#endif
