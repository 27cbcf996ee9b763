//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/tls/acceptor.hpp>
#include <boost/nbtls/detail/except.hpp>

namespace boost::nbtls::tls {

acceptor::
acceptor(
    context ctx,
    engine const& eng )
    : ctx_( std::move( ctx ) )
    , eng_( &eng )
{
    auto ec = eng_->prepare( ctx_ );
    if( ec.failed() )
        nbtls::detail::throw_system_error( ec, "acceptor" );
}

acceptor::
acceptor(
    context ctx,
    engine const& eng,
    system::error_code& ec )
    : ctx_( std::move( ctx ) )
    , eng_( &eng )
{
    ec = eng_->prepare( ctx_ );
}

handshake
accept(
    acceptor const& a,
    std::unique_ptr<transport> next )
{
    session_params params;
    params.role = role::server;
    params.use_sni = false;
    params.verify_hostname = false;
    return handshake::start(
        a.get_engine(),
        a.get_context(),
        std::move( params ),
        std::move( next ) );
}

} // namespace boost::nbtls::tls
