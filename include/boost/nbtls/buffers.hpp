//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_BUFFERS_HPP
#define BOOST_NBTLS_BUFFERS_HPP

#include <boost/nbtls/detail/config.hpp>

#include <cstddef>
#include <string_view>

namespace boost::nbtls {

/** A contiguous range of writable bytes.

    The buffer does not own the memory it refers to.
*/
class mutable_buffer
{
    unsigned char* p_ = nullptr;
    std::size_t n_ = 0;

public:
    mutable_buffer() = default;

    mutable_buffer(
        void* data,
        std::size_t size) noexcept
        : p_( static_cast<unsigned char*>( data ) )
        , n_( size )
    {
    }

    void*
    data() const noexcept
    {
        return p_;
    }

    std::size_t
    size() const noexcept
    {
        return n_;
    }

    /// Remove `n` bytes from the front of the buffer.
    mutable_buffer&
    operator+=( std::size_t n ) noexcept
    {
        if( n > n_ )
            n = n_;
        p_ += n;
        n_ -= n;
        return *this;
    }
};

/** A contiguous range of read-only bytes.

    The buffer does not own the memory it refers to.
*/
class const_buffer
{
    unsigned char const* p_ = nullptr;
    std::size_t n_ = 0;

public:
    const_buffer() = default;

    const_buffer(
        void const* data,
        std::size_t size) noexcept
        : p_( static_cast<unsigned char const*>( data ) )
        , n_( size )
    {
    }

    const_buffer( mutable_buffer const& b ) noexcept
        : p_( static_cast<unsigned char const*>( b.data() ) )
        , n_( b.size() )
    {
    }

    void const*
    data() const noexcept
    {
        return p_;
    }

    std::size_t
    size() const noexcept
    {
        return n_;
    }

    /// Remove `n` bytes from the front of the buffer.
    const_buffer&
    operator+=( std::size_t n ) noexcept
    {
        if( n > n_ )
            n = n_;
        p_ += n;
        n_ -= n;
        return *this;
    }
};

inline
mutable_buffer
buffer( void* data, std::size_t size ) noexcept
{
    return mutable_buffer( data, size );
}

inline
const_buffer
buffer( void const* data, std::size_t size ) noexcept
{
    return const_buffer( data, size );
}

inline
const_buffer
buffer( std::string_view s ) noexcept
{
    return const_buffer( s.data(), s.size() );
}

} // namespace boost::nbtls

#endif
