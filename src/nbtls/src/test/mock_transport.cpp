//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/test/mock_transport.hpp>
#include <boost/nbtls/error.hpp>

#include <algorithm>
#include <cstring>

namespace boost::nbtls::test {

mock_transport::
mock_transport()
    : sc_(std::make_shared<script>())
{
}

mock_transport::
mock_transport(std::shared_ptr<script> sc)
    : sc_(std::move(sc))
{
}

mock_transport::
~mock_transport()
{
    sc_->destroyed = true;
}

poll_result<std::size_t>
mock_transport::
read_some(mutable_buffer buf)
{
    ++sc_->reads;
    if(sc_->read_blocks > 0)
    {
        --sc_->read_blocks;
        return would_block{want::read};
    }
    if(sc_->read_error)
        return sc_->read_error;
    if(sc_->provide.empty())
    {
        if(sc_->eof)
            return make_error_code(error::eof);
        return would_block{want::read};
    }

    auto const n = (std::min)(buf.size(), sc_->provide.size());
    std::memcpy(buf.data(), sc_->provide.data(), n);
    sc_->provide.erase(0, n);
    return n;
}

poll_result<std::size_t>
mock_transport::
write_some(const_buffer buf)
{
    ++sc_->writes;
    if(sc_->write_blocks > 0)
    {
        --sc_->write_blocks;
        return would_block{want::write};
    }
    if(sc_->write_error)
        return sc_->write_error;

    sc_->written.append(
        static_cast<char const*>(buf.data()), buf.size());
    return buf.size();
}

poll_result<>
mock_transport::
flush()
{
    ++sc_->flushes;
    return {};
}

} // namespace boost::nbtls::test
