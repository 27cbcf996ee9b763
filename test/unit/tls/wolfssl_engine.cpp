//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifdef BOOST_NBTLS_HAS_WOLFSSL

// Test that header file is self-contained.
#include <boost/nbtls/tls/wolfssl.hpp>

#include "test_utils.hpp"

#include <string>

namespace boost::nbtls::tls::test {

struct wolfssl_engine_test
{
    engine const& eng = wolfssl_engine();

    void
    testName()
    {
        BOOST_TEST_EQ( std::string( eng.name() ), "wolfssl" );
        BOOST_TEST_EQ( std::string( wolfssl_category().name() ),
            "boost.nbtls.wolfssl" );
    }

    void
    run()
    {
        testName();
        check_handshake_and_echo( eng );
        check_bulk_transfer( eng );
        check_untrusted_ca( eng );
        check_expired_certificate( eng );
        check_hostname_mismatch( eng );
        check_truncation( eng );
        check_graceful_shutdown( eng );
        check_setup_failure( eng );
        check_socket_handshake( eng );
    }
};

TEST_SUITE(wolfssl_engine_test, "boost.nbtls.tls.wolfssl");

} // namespace boost::nbtls::tls::test

#endif
