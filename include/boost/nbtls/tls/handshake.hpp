//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TLS_HANDSHAKE_HPP
#define BOOST_NBTLS_TLS_HANDSHAKE_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/poll_result.hpp>
#include <boost/nbtls/transport.hpp>
#include <boost/nbtls/tls/context.hpp>
#include <boost/nbtls/tls/engine.hpp>
#include <boost/nbtls/tls/stream.hpp>
#include <boost/system/error_code.hpp>

#include <memory>
#include <variant>

namespace boost::nbtls::tls {

namespace detail {

struct hs_in_transition
{
};

struct hs_not_started
{
    engine const* eng;
    context ctx;
    session_params params;
    std::unique_ptr<transport> next;
};

struct hs_in_progress
{
    std::unique_ptr<session> s;
    want interest;
};

struct hs_failed
{
    system::error_code ec;
};

struct hs_completed
{
    std::unique_ptr<session> s;
};

struct hs_consumed
{
};

} // namespace detail

/** A pollable handshake attempt.

    A handshake is created by @ref connect or @ref accept, which
    perform no I/O. Each call to @ref step advances the
    handshake as far as the transport allows and reports one of:

    @li Ready, holding the @ref stream for the established
        connection.
    @li Suspended, naming the readiness to wait for before the
        next step. All handshake progress is kept.
    @li Failed, holding the error which ended the handshake.

    Ready and failed are delivered exactly once. Stepping again
    afterwards throws `std::logic_error`.

    Destroying a handshake at any point releases the session and
    the transport without further I/O.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @par Example
    @code
    auto hs = tls::connect( connector, "www.example.com",
        std::make_unique<nbtls::socket_transport>( std::move( sock ) ) );
    for(;;)
    {
        auto r = hs.step();
        if( r.ready() )
            return std::move( r ).value();
        if( r.failed() )
            throw system::system_error( r.error() );
        wait_for( r.interest() );
    }
    @endcode
*/
class BOOST_NBTLS_DECL handshake
{
    using state = std::variant<
        detail::hs_in_transition,
        detail::hs_not_started,
        detail::hs_in_progress,
        detail::hs_failed,
        detail::hs_completed,
        detail::hs_consumed>;

    state st_;
    tls::role role_;

    handshake( tls::role r, state st ) noexcept;

    static state begin( detail::hs_not_started ns );
    static state resume( std::unique_ptr<session> s );

public:
    /** Move constructor.

        The moved-from handshake is done; stepping it throws
        `std::logic_error`.
    */
    handshake( handshake&& other ) noexcept;

    /// @copydoc handshake(handshake&&)
    handshake& operator=( handshake&& other ) noexcept;

    /** Return a handshake which has not started.

        The first @ref step creates the session from `eng` and
        starts the handshake.

        @param eng The engine. Must outlive the handshake.
        @param ctx The configuration.
        @param params The per-connection parameters.
        @param next The transport.
    */
    static
    handshake
    start(
        engine const& eng,
        context ctx,
        session_params params,
        std::unique_ptr<transport> next );

    /** Return a handshake which already failed.

        The first @ref step returns `ec`.

        @param r The role the handshake would have performed.
        @param ec The error, which must indicate failure.
    */
    static
    handshake
    fail(
        tls::role r,
        system::error_code ec ) noexcept;

    /** Advance the handshake.

        @throws std::logic_error if a previous step returned ready
            or failed.
    */
    poll_result<stream>
    step();

    /// Return the side of the handshake being performed.
    tls::role
    role() const noexcept
    {
        return role_;
    }

    /// Return `true` once a step has returned ready or failed.
    bool
    is_done() const noexcept
    {
        return std::holds_alternative<detail::hs_consumed>( st_ );
    }
};

} // namespace boost::nbtls::tls

#endif
