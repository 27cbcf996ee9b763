//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TRANSPORT_HPP
#define BOOST_NBTLS_TRANSPORT_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/buffers.hpp>
#include <boost/nbtls/poll_result.hpp>

#include <cstddef>

namespace boost::nbtls {

/** A duplex byte channel with non-blocking operations.

    A transport carries the encrypted bytes of a secure session.
    None of its operations may block the calling thread: when the
    channel is not ready, the operation returns a suspended result
    naming the readiness it waits for, and the caller invokes the
    operation again once the channel is ready.

    A transport is exclusively owned by whichever object is
    currently driving it. Destroying the owner destroys the
    transport.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe.
*/
class BOOST_NBTLS_DECL transport
{
public:
    virtual ~transport() = default;

    /** Read some bytes from the channel.

        @param buf The buffer to read into. Its size is greater
            than zero.

        @return The number of bytes read, which is greater than
            zero; suspended with `want::read` when no bytes are
            available; @ref error::eof when the peer closed its
            end; or another error when the channel failed.
    */
    virtual
    poll_result<std::size_t>
    read_some( mutable_buffer buf ) = 0;

    /** Write some bytes to the channel.

        @param buf The bytes to write. Its size is greater than zero.

        @return The number of bytes accepted, which is greater than
            zero; suspended with `want::write` when the channel
            cannot accept bytes; or an error when the channel
            failed. Writing after the peer closed its end fails with
            `errc::broken_pipe`.
    */
    virtual
    poll_result<std::size_t>
    write_some( const_buffer buf ) = 0;

    /** Push bytes buffered by the channel towards the peer.

        Transports without their own buffering return ready.
    */
    virtual
    poll_result<>
    flush()
    {
        return {};
    }
};

} // namespace boost::nbtls

#endif
