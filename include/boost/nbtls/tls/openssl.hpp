//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TLS_OPENSSL_HPP
#define BOOST_NBTLS_TLS_OPENSSL_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/tls/engine.hpp>
#include <boost/system/error_code.hpp>

namespace boost::nbtls::tls {

/** Return the engine implemented with OpenSSL.

    The native session handle of this engine is an `SSL*`.

    @par Example
    @code
    tls::acceptor a( ctx, tls::openssl_engine() );
    @endcode
*/
BOOST_NBTLS_DECL
engine const&
openssl_engine() noexcept;

/** Return the category of errors reported by OpenSSL.

    Error values are the packed codes returned by
    `ERR_get_error`. Every code in this category is equivalent
    to @ref condition::protocol_failure.
*/
BOOST_NBTLS_DECL
system::error_category const&
openssl_category() noexcept;

} // namespace boost::nbtls::tls

#endif
