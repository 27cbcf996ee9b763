//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_POLL_RESULT_HPP
#define BOOST_NBTLS_POLL_RESULT_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/detail/except.hpp>
#include <boost/assert.hpp>
#include <boost/system/error_code.hpp>

#include <utility>
#include <variant>

namespace boost::nbtls {

/** The readiness a suspended operation is waiting for.

    @see would_block
*/
enum class want
{
    /// The transport must become readable.
    read,

    /// The transport must become writable.
    write
};

/** A non-error signal that an operation cannot make progress yet.

    The operation keeps all of its state. The caller waits until
    the transport reaches the readiness named by @ref interest
    and then invokes the same operation again.
*/
struct would_block
{
    want interest;
};

/** The outcome of one call to a pollable operation.

    A poll result is in exactly one of three states:

    @li <em>Ready</em>, holding the value produced by the operation.
    @li <em>Suspended</em>, holding the readiness interest. This is
        not an error; the operation must be invoked again later.
    @li <em>Failed</em>, holding the error which ended the operation.

    @tparam T The value type, or `void` for operations which
        produce no value.
*/
template<class T = void>
class poll_result
{
    std::variant<T, would_block, system::error_code> v_;

public:
    /// Construct a ready result holding `value`.
    poll_result( T value )
        : v_( std::in_place_index<0>, std::move( value ) )
    {
    }

    /// Construct a suspended result.
    poll_result( would_block wb ) noexcept
        : v_( std::in_place_index<1>, wb )
    {
    }

    /** Construct a failed result.

        @param ec The error, which must indicate failure.
    */
    poll_result( system::error_code ec ) noexcept
        : v_( std::in_place_index<2>, ec )
    {
        BOOST_ASSERT( ec.failed() );
    }

    bool
    ready() const noexcept
    {
        return v_.index() == 0;
    }

    bool
    suspended() const noexcept
    {
        return v_.index() == 1;
    }

    bool
    failed() const noexcept
    {
        return v_.index() == 2;
    }

    /** Return the readiness interest.

        @par Preconditions
        `suspended() == true`
    */
    want
    interest() const noexcept
    {
        BOOST_ASSERT( suspended() );
        return std::get<1>( v_ ).interest;
    }

    /** Return the error.

        @return The error if failed, otherwise a
            default-constructed error code.
    */
    system::error_code
    error() const noexcept
    {
        if( failed() )
            return std::get<2>( v_ );
        return {};
    }

    /** Return the value.

        @throws system::system_error if the result is failed.
        @throws std::logic_error if the result is suspended.
    */
    T&
    value() &
    {
        check();
        return std::get<0>( v_ );
    }

    /// @copydoc value
    T const&
    value() const&
    {
        check();
        return std::get<0>( v_ );
    }

    /// @copydoc value
    T&&
    value() &&
    {
        check();
        return std::get<0>( std::move( v_ ) );
    }

    T*
    operator->()
    {
        return &value();
    }

    T&
    operator*() &
    {
        return value();
    }

private:
    void
    check() const
    {
        if( failed() )
            detail::throw_system_error( std::get<2>( v_ ) );
        if( suspended() )
            detail::throw_logic_error( "value of suspended poll_result" );
    }
};

//------------------------------------------------------------------------------

/** The outcome of one call to a pollable operation producing no value.

    A default-constructed result is ready.
*/
template<>
class poll_result<void>
{
    std::variant<std::monostate, would_block, system::error_code> v_;

public:
    /// Construct a ready result.
    poll_result() = default;

    /// Construct a suspended result.
    poll_result( would_block wb ) noexcept
        : v_( std::in_place_index<1>, wb )
    {
    }

    /** Construct a failed result.

        @param ec The error, which must indicate failure.
    */
    poll_result( system::error_code ec ) noexcept
        : v_( std::in_place_index<2>, ec )
    {
        BOOST_ASSERT( ec.failed() );
    }

    bool
    ready() const noexcept
    {
        return v_.index() == 0;
    }

    bool
    suspended() const noexcept
    {
        return v_.index() == 1;
    }

    bool
    failed() const noexcept
    {
        return v_.index() == 2;
    }

    want
    interest() const noexcept
    {
        BOOST_ASSERT( suspended() );
        return std::get<1>( v_ ).interest;
    }

    system::error_code
    error() const noexcept
    {
        if( failed() )
            return std::get<2>( v_ );
        return {};
    }

    /** Throw if the result is not ready.

        @throws system::system_error if the result is failed.
        @throws std::logic_error if the result is suspended.
    */
    void
    value() const
    {
        if( failed() )
            detail::throw_system_error( std::get<2>( v_ ) );
        if( suspended() )
            detail::throw_logic_error( "value of suspended poll_result" );
    }
};

} // namespace boost::nbtls

#endif
