//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

// Test that header file is self-contained.
#include <boost/nbtls/poll_result.hpp>

#include <boost/nbtls/error.hpp>
#include <boost/system/system_error.hpp>

#include "test_suite.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace boost::nbtls {

struct poll_result_test
{
    void
    testReady()
    {
        poll_result<int> r( 42 );
        BOOST_TEST( r.ready() );
        BOOST_TEST_NOT( r.suspended() );
        BOOST_TEST_NOT( r.failed() );
        BOOST_TEST( !r.error() );
        BOOST_TEST_EQ( r.value(), 42 );
        BOOST_TEST_EQ( *r, 42 );

        poll_result<std::string> s( std::string( "hello" ) );
        BOOST_TEST_EQ( s->size(), 5u );
    }

    void
    testSuspended()
    {
        poll_result<int> r( would_block{ want::write } );
        BOOST_TEST( r.suspended() );
        BOOST_TEST_NOT( r.ready() );
        BOOST_TEST_NOT( r.failed() );
        BOOST_TEST( r.interest() == want::write );
        BOOST_TEST( !r.error() );
        BOOST_TEST_THROWS( r.value(), std::logic_error );

        poll_result<> v( would_block{ want::read } );
        BOOST_TEST( v.suspended() );
        BOOST_TEST( v.interest() == want::read );
        BOOST_TEST_THROWS( v.value(), std::logic_error );
    }

    void
    testFailed()
    {
        poll_result<int> r( make_error_code( error::stream_truncated ) );
        BOOST_TEST( r.failed() );
        BOOST_TEST_NOT( r.ready() );
        BOOST_TEST_NOT( r.suspended() );
        BOOST_TEST( r.error() == error::stream_truncated );
        BOOST_TEST_THROWS( r.value(), system::system_error );

        poll_result<> v( make_error_code( error::eof ) );
        BOOST_TEST( v.failed() );
        BOOST_TEST( v.error() == error::eof );
        BOOST_TEST_THROWS( v.value(), system::system_error );
    }

    void
    testVoid()
    {
        poll_result<> r;
        BOOST_TEST( r.ready() );
        BOOST_TEST( !r.error() );
        r.value();
    }

    void
    testMoveOnly()
    {
        poll_result<std::unique_ptr<int>> r(
            std::make_unique<int>( 7 ) );
        BOOST_TEST( r.ready() );
        auto p = std::move( r ).value();
        BOOST_TEST( p != nullptr );
        BOOST_TEST_EQ( *p, 7 );
    }

    void
    run()
    {
        testReady();
        testSuspended();
        testFailed();
        testVoid();
        testMoveOnly();
    }
};

TEST_SUITE(poll_result_test, "boost.nbtls.poll_result");

} // namespace boost::nbtls
