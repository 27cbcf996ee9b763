//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/tls/stream.hpp>
#include <boost/nbtls/error.hpp>
#include <boost/nbtls/detail/except.hpp>
#include "src/detail/log.hpp"

#include <boost/assert.hpp>

#include <utility>

namespace boost::nbtls::tls {

namespace {

// The peer closed the transport instead of answering our close-notify
bool
is_clean_close( system::error_code const& ec ) noexcept
{
    return ec == error::eof ||
        ec == system::errc::broken_pipe;
}

} // namespace

stream::
stream( std::unique_ptr<session> s ) noexcept
    : s_( std::move( s ) )
{
    BOOST_ASSERT( s_ );
}

stream::
stream( stream&& other ) noexcept
    : s_( std::move( other.s_ ) )
    , phase_( std::exchange( other.phase_, phase::closed ) )
{
}

stream&
stream::
operator=( stream&& other ) noexcept
{
    if( this != &other )
    {
        s_ = std::move( other.s_ );
        phase_ = std::exchange( other.phase_, phase::closed );
    }
    return *this;
}

session&
stream::
get( char const* what )
{
    if( !s_ )
        nbtls::detail::throw_logic_error( what );
    return *s_;
}

poll_result<std::size_t>
stream::
read_some( mutable_buffer buf )
{
    auto& s = get( "read from moved-from stream" );
    if( buf.size() == 0 )
        return std::size_t( 0 );
    return s.read_some( buf );
}

poll_result<std::size_t>
stream::
write_some( const_buffer buf )
{
    auto& s = get( "write to moved-from stream" );
    if( buf.size() == 0 )
        return std::size_t( 0 );
    return s.write_some( buf );
}

poll_result<>
stream::
flush()
{
    return get( "flush of moved-from stream" ).flush();
}

poll_result<>
stream::
shutdown()
{
    if( is_closed() )
        nbtls::detail::throw_logic_error(
            "stream shutdown polled after completion" );

    auto& s = get( "shutdown of moved-from stream" );
    for(;;)
    {
        auto r = s.shutdown();

        if( r.suspended() )
            return would_block{ r.interest() };

        if( r.failed() )
        {
            auto const ec = r.error();
            if( is_clean_close( ec ) )
            {
                nbtls::detail::log().debug(
                    "shutdown: peer closed the transport ({})",
                    ec.message() );
                phase_ = phase::closed;
                return {};
            }
            nbtls::detail::log().debug( "shutdown failed: {}", ec.message() );
            phase_ = phase::failed;
            return ec;
        }

        if( *r == shutdown_state::received )
        {
            nbtls::detail::log().trace( "shutdown: close-notify received" );
            phase_ = phase::closed;
            return {};
        }

        // sent: ask once more for the peer's close-notify
        if( phase_ == phase::sent )
            return would_block{ want::read };
        nbtls::detail::log().trace( "shutdown: close-notify sent" );
        phase_ = phase::sent;
    }
}

} // namespace boost::nbtls::tls
