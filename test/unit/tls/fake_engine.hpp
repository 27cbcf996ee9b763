//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TEST_TLS_FAKE_ENGINE_HPP
#define BOOST_NBTLS_TEST_TLS_FAKE_ENGINE_HPP

#include <boost/nbtls/error.hpp>
#include <boost/nbtls/tls/engine.hpp>

#include <algorithm>
#include <memory>
#include <new>
#include <string>
#include <vector>

namespace boost {
namespace nbtls {
namespace tls {
namespace test {

/** What a fake engine and its sessions do, and what they saw.

    The session handshake performs no cryptography. It reads
    `hello.size()` bytes from the transport and expects them to
    equal `hello`, so a suspended transport suspends the
    handshake. Extra scripted suspensions and a final error may
    be added on top.
*/
struct fake_script
{
    /// Returned by engine::prepare and make_session.
    system::error_code setup_error;

    /// Bytes the handshake reads before completing.
    std::string hello;

    /// Handshake calls which suspend before any transport I/O.
    std::size_t handshake_blocks = 0;
    want block_interest = want::write;

    /// Returned by the handshake once the blocks are used up.
    system::error_code handshake_error;

    /// The next handshake call throws std::bad_alloc.
    bool handshake_throws = false;

    /// Results of successive shutdown calls. Once used up,
    /// shutdown reports shutdown_state::received.
    std::vector<poll_result<shutdown_state>> shutdown_steps;

    // Observations
    std::size_t sessions = 0;
    std::size_t handshake_calls = 0;
    std::size_t shutdown_calls = 0;
    std::size_t sessions_destroyed = 0;
    session_params last_params;
};

class fake_session : public session
{
    std::shared_ptr<fake_script> sc_;
    std::unique_ptr<transport> next_;
    std::string got_;
    std::size_t shutdown_index_ = 0;

public:
    fake_session(
        std::shared_ptr<fake_script> sc,
        std::unique_ptr<transport> next )
        : sc_( std::move( sc ) )
        , next_( std::move( next ) )
    {
    }

    ~fake_session()
    {
        ++sc_->sessions_destroyed;
    }

    poll_result<>
    handshake() override
    {
        ++sc_->handshake_calls;
        if( sc_->handshake_throws )
        {
            sc_->handshake_throws = false;
            throw std::bad_alloc();
        }
        if( sc_->handshake_blocks > 0 )
        {
            --sc_->handshake_blocks;
            return would_block{ sc_->block_interest };
        }
        while( got_.size() < sc_->hello.size() )
        {
            char buf[64];
            auto const want_n = ( std::min )(
                sizeof( buf ), sc_->hello.size() - got_.size() );
            auto r = next_->read_some( buffer( buf, want_n ) );
            if( !r.ready() )
            {
                if( r.suspended() )
                    return would_block{ r.interest() };
                return r.error();
            }
            got_.append( buf, *r );
        }
        if( got_ != sc_->hello )
            return make_error_code( error::stream_truncated );
        if( sc_->handshake_error )
            return sc_->handshake_error;
        return {};
    }

    poll_result<std::size_t>
    read_some( mutable_buffer buf ) override
    {
        return next_->read_some( buf );
    }

    poll_result<std::size_t>
    write_some( const_buffer buf ) override
    {
        return next_->write_some( buf );
    }

    poll_result<>
    flush() override
    {
        return next_->flush();
    }

    poll_result<shutdown_state>
    shutdown() override
    {
        ++sc_->shutdown_calls;
        if( shutdown_index_ < sc_->shutdown_steps.size() )
            return sc_->shutdown_steps[shutdown_index_++];
        return shutdown_state::received;
    }

    transport&
    next_layer() noexcept override
    {
        return *next_;
    }

    std::string_view
    alpn_protocol() const noexcept override
    {
        return "fake/1";
    }
};

class fake_engine : public engine
{
    std::shared_ptr<fake_script> sc_;

public:
    explicit
    fake_engine( std::shared_ptr<fake_script> sc )
        : sc_( std::move( sc ) )
    {
    }

    char const*
    name() const noexcept override
    {
        return "fake";
    }

    system::error_code
    prepare( context const& ) const override
    {
        return sc_->setup_error;
    }

    std::unique_ptr<session>
    make_session(
        context const&,
        session_params const& params,
        std::unique_ptr<transport> next,
        system::error_code& ec ) const override
    {
        sc_->last_params = params;
        if( sc_->setup_error )
        {
            ec = sc_->setup_error;
            return nullptr;
        }
        ++sc_->sessions;
        return std::make_unique<fake_session>( sc_, std::move( next ) );
    }
};

} // namespace test
} // namespace tls
} // namespace nbtls
} // namespace boost

#endif
