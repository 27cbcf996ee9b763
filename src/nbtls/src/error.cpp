//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/error.hpp>

namespace boost::nbtls {

namespace {

struct error_category_impl
    : system::error_category
{
    char const*
    name() const noexcept override
    {
        return "boost.nbtls";
    }

    std::string
    message( int ev ) const override
    {
        switch( static_cast<error>( ev ) )
        {
        case error::eof: return "end of stream";
        case error::stream_truncated: return "stream truncated";
        case error::setup_failed: return "secure session setup failed";
        }
        return "unknown error";
    }

    system::error_condition
    default_error_condition( int ev ) const noexcept override
    {
        switch( static_cast<error>( ev ) )
        {
        case error::setup_failed:
            return condition::setup_failure;
        case error::stream_truncated:
            return condition::protocol_failure;
        default:
            return { ev, *this };
        }
    }
};

struct condition_category_impl
    : system::error_category
{
    char const*
    name() const noexcept override
    {
        return "boost.nbtls.condition";
    }

    std::string
    message( int ev ) const override
    {
        switch( static_cast<condition>( ev ) )
        {
        case condition::setup_failure: return "setup failure";
        case condition::protocol_failure: return "protocol failure";
        case condition::transport_failure: return "transport failure";
        }
        return "unknown condition";
    }

    // Transports report operating system errors unchanged
    bool
    equivalent(
        system::error_code const& ec,
        int cv) const noexcept override
    {
        if( static_cast<condition>( cv ) == condition::transport_failure &&
            ( ec.category() == system::system_category() ||
              ec.category() == system::generic_category() ) )
            return ec.failed();
        return ec.default_error_condition() ==
            system::error_condition( cv, *this );
    }
};

} // namespace

system::error_category const&
get_error_category() noexcept
{
    static error_category_impl const cat;
    return cat;
}

system::error_category const&
get_condition_category() noexcept
{
    static condition_category_impl const cat;
    return cat;
}

} // namespace boost::nbtls
