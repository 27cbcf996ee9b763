//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TLS_STREAM_HPP
#define BOOST_NBTLS_TLS_STREAM_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/buffers.hpp>
#include <boost/nbtls/poll_result.hpp>
#include <boost/nbtls/transport.hpp>
#include <boost/nbtls/tls/engine.hpp>
#include <boost/assert.hpp>

#include <cstddef>
#include <memory>
#include <string_view>

namespace boost::nbtls::tls {

/** An established secure byte stream.

    A stream is produced by a completed @ref handshake and owns
    the session, and through it the transport, for the rest of
    the connection. Reads, writes and flushes are passed to the
    session unchanged; the stream adds no buffering.

    Every operation is non-blocking and returns a
    @ref poll_result. When suspended, wait for the named
    readiness on the transport and call the operation again.

    @par Graceful Shutdown

    @ref shutdown exchanges close-notify alerts with the peer.
    Once our close-notify is sent the stream waits for the
    peer's, reporting a suspended result meanwhile. The shutdown
    succeeds when the peer's close-notify arrives, or when the
    peer closes the transport without one. Any other failure
    fails the shutdown, which is then finished.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @par Example
    @code
    auto r = s.write_some( nbtls::buffer( "hello" ) );
    if( r.suspended() )
        wait_for( r.interest() );
    @endcode
*/
class BOOST_NBTLS_DECL stream
{
    enum class phase : unsigned char
    {
        open,
        sent,
        closed,
        failed
    };

    std::unique_ptr<session> s_;
    phase phase_ = phase::open;

public:
    /** Construct a stream from a session whose handshake completed.

        @param s The session. Must not be null.
    */
    explicit
    stream( std::unique_ptr<session> s ) noexcept;

    /** Move constructor.

        The moved-from stream is closed. Reading, writing or
        shutting it down throws `std::logic_error`.
    */
    stream( stream&& other ) noexcept;

    /// @copydoc stream(stream&&)
    stream& operator=( stream&& other ) noexcept;

    /** Read some decrypted bytes.

        @param buf The buffer to read into. An empty buffer
            completes immediately with zero bytes.

        @return The number of bytes read, @ref error::eof after
            the peer's close-notify, or
            @ref error::stream_truncated if the transport ended
            without one.
    */
    poll_result<std::size_t>
    read_some( mutable_buffer buf );

    /** Write some bytes.

        The bytes are encrypted and handed to the transport. After
        a suspended result, call again with at least the same bytes.

        @param buf The bytes to write. An empty buffer completes
            immediately with zero bytes.

        @return The number of bytes consumed from `buf`.
    */
    poll_result<std::size_t>
    write_some( const_buffer buf );

    /// Push encrypted bytes held by the session or transport.
    poll_result<>
    flush();

    /** Perform one step of the graceful shutdown.

        @return Ready when the shutdown finished, suspended while
            waiting for the transport, or the error which ended it.

        @throws std::logic_error if a previous call already
            returned ready or failed.
    */
    poll_result<>
    shutdown();

    /// Return `true` once our close-notify was sent.
    bool
    shutdown_sent() const noexcept
    {
        return phase_ != phase::open;
    }

    /// Return `true` once the shutdown returned a final result.
    bool
    is_closed() const noexcept
    {
        return phase_ == phase::closed || phase_ == phase::failed;
    }

    /** Return the transport.

        @par Preconditions
        The stream was not moved from.
    */
    transport&
    next_layer() noexcept
    {
        BOOST_ASSERT( s_ );
        return s_->next_layer();
    }

    /// Return the negotiated ALPN protocol, or an empty string.
    std::string_view
    alpn_protocol() const noexcept
    {
        if( !s_ )
            return {};
        return s_->alpn_protocol();
    }

    /// Return the engine's native session handle, or null.
    void*
    native_handle() noexcept
    {
        if( !s_ )
            return nullptr;
        return s_->native_handle();
    }

private:
    session&
    get( char const* what );
};

} // namespace boost::nbtls::tls

#endif
