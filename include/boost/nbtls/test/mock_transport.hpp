//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TEST_MOCK_TRANSPORT_HPP
#define BOOST_NBTLS_TEST_MOCK_TRANSPORT_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/transport.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace boost::nbtls::test {

/** A scripted transport for testing.

    Reads return the bytes staged with @ref provide and writes
    are recorded in @ref written. The script is held in a shared
    @ref script object so a test can keep inspecting it after the
    transport was moved into a handshake or stream.

    @par Example
    @code
    auto t = std::make_unique<mock_transport>();
    auto sc = t->get_script();
    sc->provide = "hello";
    sc->read_blocks = 2;    // the first two reads suspend
    @endcode
*/
class BOOST_NBTLS_DECL mock_transport
    : public transport
{
public:
    struct script
    {
        /// Bytes returned by upcoming reads.
        std::string provide;

        /// Every byte accepted by writes so far.
        std::string written;

        /// Number of upcoming reads which suspend.
        std::size_t read_blocks = 0;

        /// Number of upcoming writes which suspend.
        std::size_t write_blocks = 0;

        /// When set, reads return @ref error::eof once `provide` is empty.
        bool eof = false;

        /// When set, reads fail with this error.
        system::error_code read_error;

        /// When set, writes fail with this error.
        system::error_code write_error;

        std::size_t reads = 0;
        std::size_t writes = 0;
        std::size_t flushes = 0;

        /// `true` once the transport was destroyed.
        bool destroyed = false;
    };

    mock_transport();

    explicit
    mock_transport(std::shared_ptr<script> sc);

    ~mock_transport();

    /// Return the script shared with this transport.
    std::shared_ptr<script>
    get_script() const noexcept
    {
        return sc_;
    }

    /// Append bytes to be returned by upcoming reads.
    void
    provide(std::string s)
    {
        sc_->provide.append(std::move(s));
    }

    poll_result<std::size_t>
    read_some(mutable_buffer buf) override;

    poll_result<std::size_t>
    write_some(const_buffer buf) override;

    poll_result<>
    flush() override;

private:
    std::shared_ptr<script> sc_;
};

} // namespace boost::nbtls::test

#endif
