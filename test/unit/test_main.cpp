//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include "test_suite.hpp"

#include <iostream>
#include <string_view>

namespace {

// A suite runs when no filter is given, or when its
// name starts with one of the filters.
bool
selected(
    std::string_view name,
    int argc,
    char** argv )
{
    if( argc < 2 )
        return true;
    for( int i = 1; i < argc; ++i )
        if( name.substr( 0, std::string_view( argv[i] ).size() ) == argv[i] )
            return true;
    return false;
}

} // namespace

int
main( int argc, char** argv )
{
    int n = 0;
    for( auto const* s : test_suite::suites::instance().all() )
    {
        if( !selected( s->name(), argc, argv ) )
            continue;
        std::cout << s->name() << std::endl;
        s->run();
        ++n;
    }
    std::cout << n << " suites run" << std::endl;
    return boost::report_errors();
}
