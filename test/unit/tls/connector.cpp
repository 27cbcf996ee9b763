//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

// Test that header file is self-contained.
#include <boost/nbtls/tls/connector.hpp>
#include <boost/nbtls/tls/acceptor.hpp>

#include <boost/nbtls/error.hpp>
#include <boost/nbtls/test/mock_transport.hpp>
#include <boost/system/system_error.hpp>

#include "fake_engine.hpp"
#include "test_suite.hpp"

#include <memory>
#include <stdexcept>

namespace boost::nbtls::tls::test {

struct connector_test
{
    using mock = nbtls::test::mock_transport;

    void
    testConfigure()
    {
        auto sc = std::make_shared<fake_script>();
        fake_engine eng( sc );
        context ctx;
        connector c( ctx, eng );
        BOOST_TEST( &c.get_engine() == &eng );

        auto cfg = c.configure();
        BOOST_TEST( cfg.use_server_name_indication() );
        BOOST_TEST( cfg.verify_hostname() );
        BOOST_TEST( &cfg.get_engine() == &eng );

        cfg.set_use_server_name_indication( false );
        cfg.set_verify_hostname( false );
        BOOST_TEST_NOT( cfg.use_server_name_indication() );
        BOOST_TEST_NOT( cfg.verify_hostname() );

        // Options apply to this connection only
        BOOST_TEST( c.configure().use_server_name_indication() );
    }

    void
    testConnectForwardsOptions()
    {
        auto sc = std::make_shared<fake_script>();
        fake_engine eng( sc );
        connector c( context(), eng );

        auto cfg = c.configure();
        cfg.set_use_server_name_indication( false );
        auto hs = connect( cfg, "db.internal", std::make_unique<mock>() );
        BOOST_TEST( hs.step().ready() );

        BOOST_TEST( sc->last_params.role == role::client );
        BOOST_TEST_EQ( sc->last_params.hostname, "db.internal" );
        BOOST_TEST_NOT( sc->last_params.use_sni );
        BOOST_TEST( sc->last_params.verify_hostname );
    }

    void
    testConfigureFailure()
    {
        auto sc = std::make_shared<fake_script>();
        sc->setup_error = make_error_code( error::setup_failed );
        fake_engine eng( sc );
        connector c( context(), eng );

        system::error_code ec;
        c.configure( ec );
        BOOST_TEST( ec == error::setup_failed );
        BOOST_TEST_THROWS( c.configure(), system::system_error );

        // The handshake reports it through its first step
        auto ts = std::make_shared<mock::script>();
        auto hs = connect( c, "example.org", std::make_unique<mock>( ts ) );
        BOOST_TEST( ts->destroyed );
        BOOST_TEST( hs.role() == role::client );
        auto r = hs.step();
        BOOST_TEST( r.failed() );
        BOOST_TEST( r.error() == condition::setup_failure );
        BOOST_TEST_EQ( sc->sessions, 0u );
        BOOST_TEST_THROWS( hs.step(), std::logic_error );
    }

    void
    testAcceptor()
    {
        auto sc = std::make_shared<fake_script>();
        fake_engine eng( sc );
        acceptor a( context(), eng );
        BOOST_TEST( &a.get_engine() == &eng );

        auto hs = accept( a, std::make_unique<mock>() );
        BOOST_TEST( hs.role() == role::server );
        BOOST_TEST( hs.step().ready() );
        BOOST_TEST( sc->last_params.role == role::server );
        BOOST_TEST( sc->last_params.hostname.empty() );
    }

    void
    testAcceptorFailure()
    {
        auto sc = std::make_shared<fake_script>();
        sc->setup_error = make_error_code( error::setup_failed );
        fake_engine eng( sc );

        BOOST_TEST_THROWS( acceptor a( context(), eng ), system::system_error );

        system::error_code ec;
        acceptor a( context(), eng, ec );
        BOOST_TEST( ec == error::setup_failed );
    }

    void
    run()
    {
        testConfigure();
        testConnectForwardsOptions();
        testConfigureFailure();
        testAcceptor();
        testAcceptorFailure();
    }
};

TEST_SUITE(connector_test, "boost.nbtls.tls.connector");

} // namespace boost::nbtls::tls::test
