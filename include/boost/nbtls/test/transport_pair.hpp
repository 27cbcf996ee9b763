//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TEST_TRANSPORT_PAIR_HPP
#define BOOST_NBTLS_TEST_TRANSPORT_PAIR_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/transport.hpp>

#include <cstddef>
#include <memory>

namespace boost::nbtls::test {

/** Controls and counters for one end of a transport pair.

    Tests set `block_reads` and `block_writes` to make the next
    operations on that end suspend even when they could proceed.
*/
struct endpoint
{
    /// Number of upcoming reads which suspend.
    std::size_t block_reads = 0;

    /// Number of upcoming writes which suspend.
    std::size_t block_writes = 0;

    std::size_t reads = 0;
    std::size_t writes = 0;
    std::size_t bytes_read = 0;
    std::size_t bytes_written = 0;

    /// `false` once the transport for this end was destroyed.
    bool open = true;
};

/** Two in-memory transports connected to each other.

    Bytes written to one end are read from the other. A read
    with nothing buffered suspends with `want::read`. With a
    capacity, a write which finds the peer's buffer full
    suspends with `want::write`.

    Destroying one end closes it: the peer reads the remaining
    bytes and then @ref error::eof, and writes from the peer fail
    with `errc::broken_pipe`.

    The pair and its transports share their state, so either
    may outlive the other.
*/
class BOOST_NBTLS_DECL transport_pair
{
    struct state;
    class end_transport;

    std::shared_ptr<state> st_;

public:
    /** Construct a pair.

        @param capacity The most bytes buffered in each direction,
            or zero for no limit.
    */
    explicit
    transport_pair(std::size_t capacity = 0);

    ~transport_pair();

    /** Return the transport for the first end.

        @throws std::logic_error if it was already taken.
    */
    std::unique_ptr<transport>
    take_first();

    /** Return the transport for the second end.

        @throws std::logic_error if it was already taken.
    */
    std::unique_ptr<transport>
    take_second();

    endpoint&
    first() noexcept;

    endpoint&
    second() noexcept;

    /// Return the number of bytes waiting to be read by the first end.
    std::size_t
    pending_first() const noexcept;

    /// Return the number of bytes waiting to be read by the second end.
    std::size_t
    pending_second() const noexcept;
};

} // namespace boost::nbtls::test

#endif
