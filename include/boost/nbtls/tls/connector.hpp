//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TLS_CONNECTOR_HPP
#define BOOST_NBTLS_TLS_CONNECTOR_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/transport.hpp>
#include <boost/nbtls/tls/context.hpp>
#include <boost/nbtls/tls/engine.hpp>
#include <boost/nbtls/tls/handshake.hpp>
#include <boost/system/error_code.hpp>

#include <memory>
#include <string_view>

namespace boost::nbtls::tls {

/** Client configuration for a single connection.

    Obtained from @ref connector::configure. Server Name
    Indication and hostname verification are enabled by
    default and can be turned off for this connection only.
*/
class connect_configuration
{
    context ctx_;
    engine const* eng_;
    bool use_sni_ = true;
    bool verify_hostname_ = true;

public:
    connect_configuration(
        context ctx,
        engine const& eng ) noexcept
        : ctx_( std::move( ctx ) )
        , eng_( &eng )
    {
    }

    /// Enable or disable the Server Name Indication extension.
    void
    set_use_server_name_indication( bool v ) noexcept
    {
        use_sni_ = v;
    }

    bool
    use_server_name_indication() const noexcept
    {
        return use_sni_;
    }

    /** Enable or disable hostname verification.

        When disabled, the peer certificate is still verified
        according to the context's verify mode, but is not
        required to match the domain.
    */
    void
    set_verify_hostname( bool v ) noexcept
    {
        verify_hostname_ = v;
    }

    bool
    verify_hostname() const noexcept
    {
        return verify_hostname_;
    }

    context const&
    get_context() const noexcept
    {
        return ctx_;
    }

    engine const&
    get_engine() const noexcept
    {
        return *eng_;
    }
};

/** Client-side factory for handshakes.

    @par Example
    @code
    tls::context ctx;
    ctx.set_default_verify_paths();
    ctx.set_verify_mode( tls::verify_mode::peer );
    tls::connector c( ctx, tls::openssl_engine() );
    auto hs = tls::connect( c, "www.example.com", std::move( t ) );
    @endcode
*/
class BOOST_NBTLS_DECL connector
{
    context ctx_;
    engine const* eng_;

public:
    /** Construct a connector.

        @param ctx The configuration shared by all connections.
        @param eng The engine. Must outlive the connector and
            every handshake created from it.
    */
    connector(
        context ctx,
        engine const& eng ) noexcept;

    /** Return the configuration for one connection.

        The engine prepares the context first. No I/O is
        performed.

        @throws system::system_error with
            @ref error::setup_failed if the engine rejects the
            context.
    */
    connect_configuration
    configure() const;

    /// @copydoc configure
    connect_configuration
    configure( system::error_code& ec ) const;

    context const&
    get_context() const noexcept
    {
        return ctx_;
    }

    engine const&
    get_engine() const noexcept
    {
        return *eng_;
    }
};

/** Begin a client handshake.

    No I/O is performed; the first @ref handshake::step starts
    the handshake.

    @param cfg The connection configuration.
    @param domain The peer's name, forwarded to the engine for
        Server Name Indication and hostname verification.
    @param next The transport, already connected to the peer.
*/
BOOST_NBTLS_DECL
handshake
connect(
    connect_configuration const& cfg,
    std::string_view domain,
    std::unique_ptr<transport> next );

/** Begin a client handshake with the default configuration.

    If the engine rejects the context, the returned handshake
    has already failed and its first step reports the error.
*/
BOOST_NBTLS_DECL
handshake
connect(
    connector const& c,
    std::string_view domain,
    std::unique_ptr<transport> next );

} // namespace boost::nbtls::tls

#endif
