//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_SOCKET_TRANSPORT_HPP
#define BOOST_NBTLS_SOCKET_TRANSPORT_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/transport.hpp>
#include <boost/system/error_code.hpp>

#include <string_view>
#include <utility>

namespace boost::nbtls {

/** A transport over a non-blocking POSIX stream socket.

    The transport owns the socket descriptor and closes it
    when destroyed. All reads and writes are non-blocking;
    when the socket is not ready the operation is suspended
    and the caller waits for readiness, either through its
    own event loop using @ref native_handle or by calling
    @ref wait.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.

    @par Example
    @code
    nbtls::socket_transport sock;
    sock.connect( "www.example.com", "443" );
    @endcode
*/
class BOOST_NBTLS_DECL socket_transport : public transport
{
    int fd_ = -1;

public:
    /// Construct a transport with no socket.
    socket_transport() = default;

    /** Destructor.

        Closes the socket if one is open.
    */
    ~socket_transport();

    socket_transport( socket_transport&& other ) noexcept;

    socket_transport&
    operator=( socket_transport&& other ) noexcept;

    socket_transport( socket_transport const& ) = delete;
    socket_transport& operator=( socket_transport const& ) = delete;

    /** Take ownership of a connected socket.

        The descriptor is switched to non-blocking mode. Any
        socket previously owned is closed first.

        @param fd The connected stream socket.

        @return An error if the descriptor could not be made
            non-blocking. Ownership is taken either way.
    */
    system::error_code
    assign( int fd );

    /** Resolve a host and connect to it.

        Name resolution and the connection attempt block the
        calling thread. Each resolved address is tried in turn.
        Once connected, the socket is non-blocking.

        @param host The host name or address literal.
        @param service The port number or service name.

        @return The error from the last address tried, or success.
    */
    system::error_code
    connect(
        std::string_view host,
        std::string_view service );

    /** Wait until the socket reaches the given readiness.

        @param w The readiness to wait for.
        @param timeout_ms The time limit in milliseconds, or a
            negative value to wait without limit.

        @return `errc::timed_out` if the limit was reached, an
            error if polling failed, or success.
    */
    system::error_code
    wait(
        want w,
        int timeout_ms = -1 ) const;

    /// Close the socket. Has no effect if no socket is open.
    void
    close() noexcept;

    /// Return `true` if a socket is open.
    bool
    is_open() const noexcept
    {
        return fd_ >= 0;
    }

    /// Return the socket descriptor, or -1.
    int
    native_handle() const noexcept
    {
        return fd_;
    }

    /// Give up ownership of the socket descriptor.
    int
    release() noexcept
    {
        return std::exchange( fd_, -1 );
    }

    poll_result<std::size_t>
    read_some( mutable_buffer buf ) override;

    poll_result<std::size_t>
    write_some( const_buffer buf ) override;
};

/** Create a pair of connected local socket transports.

    Bytes written to one transport are read from the other.

    @throws system::system_error on failure.
*/
BOOST_NBTLS_DECL
std::pair<socket_transport, socket_transport>
make_socket_pair();

} // namespace boost::nbtls

#endif
