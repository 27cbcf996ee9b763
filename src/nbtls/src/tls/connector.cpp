//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/tls/connector.hpp>
#include <boost/nbtls/detail/except.hpp>

namespace boost::nbtls::tls {

connector::
connector(
    context ctx,
    engine const& eng ) noexcept
    : ctx_( std::move( ctx ) )
    , eng_( &eng )
{
}

connect_configuration
connector::
configure() const
{
    system::error_code ec;
    auto cfg = configure( ec );
    if( ec.failed() )
        nbtls::detail::throw_system_error( ec, "connector::configure" );
    return cfg;
}

connect_configuration
connector::
configure( system::error_code& ec ) const
{
    ec = eng_->prepare( ctx_ );
    return connect_configuration( ctx_, *eng_ );
}

handshake
connect(
    connect_configuration const& cfg,
    std::string_view domain,
    std::unique_ptr<transport> next )
{
    session_params params;
    params.role = role::client;
    params.hostname = std::string( domain );
    params.use_sni = cfg.use_server_name_indication();
    params.verify_hostname = cfg.verify_hostname();
    return handshake::start(
        cfg.get_engine(),
        cfg.get_context(),
        std::move( params ),
        std::move( next ) );
}

handshake
connect(
    connector const& c,
    std::string_view domain,
    std::unique_ptr<transport> next )
{
    system::error_code ec;
    auto cfg = c.configure( ec );
    if( ec.failed() )
        return handshake::fail( role::client, ec );
    return connect( cfg, domain, std::move( next ) );
}

} // namespace boost::nbtls::tls
