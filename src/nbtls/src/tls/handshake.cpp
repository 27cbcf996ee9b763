//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/tls/handshake.hpp>
#include <boost/nbtls/error.hpp>
#include <boost/nbtls/detail/except.hpp>
#include "src/detail/log.hpp"

#include <boost/assert.hpp>

#include <new>
#include <utility>

/*
    handshake State Machine
    =======================

        not_started --+--> completed ---> consumed   (ready)
                      |
                      +--> in_progress --+--> completed
                      |        ^         |
                      |        +---------+  (would block)
                      |                  |
                      +--> failed <------+
                              |
                              +---------> consumed   (failed)

    step() moves the whole state out, leaving in_transition,
    computes the successor, and stores it before delivering.
    The session of an in_progress attempt is the same object
    on every step, so the engine keeps its partial flight.
*/

namespace boost::nbtls::tls {

namespace {

char const*
to_string( tls::role r ) noexcept
{
    return r == tls::role::client ? "client" : "server";
}

} // namespace

handshake::
handshake( tls::role r, state st ) noexcept
    : st_( std::move( st ) )
    , role_( r )
{
}

handshake::
handshake( handshake&& other ) noexcept
    : st_( std::exchange( other.st_, state( detail::hs_consumed{} ) ) )
    , role_( other.role_ )
{
}

handshake&
handshake::
operator=( handshake&& other ) noexcept
{
    if( this != &other )
    {
        st_ = std::exchange( other.st_, state( detail::hs_consumed{} ) );
        role_ = other.role_;
    }
    return *this;
}

handshake
handshake::
start(
    engine const& eng,
    context ctx,
    session_params params,
    std::unique_ptr<transport> next )
{
    auto const r = params.role;
    return handshake( r, state(
        std::in_place_type<detail::hs_not_started>,
        detail::hs_not_started{
            &eng,
            std::move( ctx ),
            std::move( params ),
            std::move( next ) } ) );
}

handshake
handshake::
fail(
    tls::role r,
    system::error_code ec ) noexcept
{
    BOOST_ASSERT( ec.failed() );
    return handshake( r, state(
        std::in_place_type<detail::hs_failed>,
        detail::hs_failed{ ec } ) );
}

handshake::state
handshake::
begin( detail::hs_not_started ns )
{
    system::error_code ec;
    auto s = ns.eng->make_session(
        ns.ctx, ns.params, std::move( ns.next ), ec );
    if( ec )
    {
        nbtls::detail::log().debug(
            "{} handshake: {} session setup failed: {}",
            to_string( ns.params.role ), ns.eng->name(), ec.message() );
        return detail::hs_failed{ ec };
    }
    if( !s )
        return detail::hs_failed{ make_error_code( error::setup_failed ) };

    nbtls::detail::log().trace(
        "{} handshake: {} session created",
        to_string( ns.params.role ), ns.eng->name() );
    return resume( std::move( s ) );
}

handshake::state
handshake::
resume( std::unique_ptr<session> s )
{
    auto r = s->handshake();
    if( r.ready() )
        return detail::hs_completed{ std::move( s ) };
    if( r.suspended() )
        return detail::hs_in_progress{ std::move( s ), r.interest() };
    return detail::hs_failed{ r.error() };
}

poll_result<stream>
handshake::
step()
{
    auto st = std::exchange( st_, state( detail::hs_in_transition{} ) );

    try
    {
        if( auto* p = std::get_if<detail::hs_not_started>( &st ) )
            st = begin( std::move( *p ) );
        else if( auto* p = std::get_if<detail::hs_in_progress>( &st ) )
            st = resume( std::move( p->s ) );
    }
    catch( std::bad_alloc const& )
    {
        // The session is gone; later steps report the failure
        st_ = detail::hs_failed{ system::errc::make_error_code(
            system::errc::not_enough_memory ) };
        throw;
    }

    if( auto* p = std::get_if<detail::hs_in_progress>( &st ) )
    {
        auto const interest = p->interest;
        nbtls::detail::log().trace(
            "{} handshake: suspended on {}", to_string( role_ ),
            interest == want::read ? "read" : "write" );
        st_ = std::move( st );
        return would_block{ interest };
    }

    if( auto* p = std::get_if<detail::hs_completed>( &st ) )
    {
        auto s = std::move( p->s );
        st_ = detail::hs_consumed{};
        nbtls::detail::log().debug(
            "{} handshake: complete", to_string( role_ ) );
        return stream( std::move( s ) );
    }

    if( auto* p = std::get_if<detail::hs_failed>( &st ) )
    {
        auto const ec = p->ec;
        st_ = detail::hs_consumed{};
        nbtls::detail::log().debug(
            "{} handshake: failed: {}", to_string( role_ ), ec.message() );
        return ec;
    }

    st_ = detail::hs_consumed{};
    if( std::holds_alternative<detail::hs_in_transition>( st ) )
        nbtls::detail::throw_logic_error(
            "handshake polled after a step threw" );
    nbtls::detail::throw_logic_error(
        "handshake polled after completion" );
}

} // namespace boost::nbtls::tls
