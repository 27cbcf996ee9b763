//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TLS_WOLFSSL_HPP
#define BOOST_NBTLS_TLS_WOLFSSL_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/tls/engine.hpp>
#include <boost/system/error_code.hpp>

namespace boost::nbtls::tls {

/** Return the engine implemented with WolfSSL.

    The native session handle of this engine is a `WOLFSSL*`.
    The context's server name callback is not supported by this
    engine and is ignored.
*/
BOOST_NBTLS_DECL
engine const&
wolfssl_engine() noexcept;

/** Return the category of errors reported by WolfSSL.

    Error values are those returned by `wolfSSL_get_error`.
    Every code in this category is equivalent to
    @ref condition::protocol_failure.
*/
BOOST_NBTLS_DECL
system::error_category const&
wolfssl_category() noexcept;

} // namespace boost::nbtls::tls

#endif
