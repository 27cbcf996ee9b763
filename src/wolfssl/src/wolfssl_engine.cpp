//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/tls/wolfssl.hpp>
#include <boost/nbtls/error.hpp>
#include "src/detail/log.hpp"

// Internal context implementation
#include "src/tls/detail/context_impl.hpp"

// Must come before other WolfSSL headers
#include <wolfssl/options.h>
#include <wolfssl/ssl.h>
#include <wolfssl/error-ssl.h>

#include <climits>
#include <string>
#include <utility>

/*
    wolfssl_session Architecture
    ============================

    WolfSSL calls our I/O callbacks whenever it needs bytes moved.
    The callbacks call the transport directly:

    Data Flow
    ---------
    App -> wolfSSL_write -> send_callback -> next_->write_some -> Network
    App <- wolfSSL_read  <- recv_callback <- next_->read_some  <- Network

    WANT_READ / WANT_WRITE Pattern
    ------------------------------
    When the transport would block, the callback records the
    readiness interest and returns WOLFSSL_CBIO_ERR_WANT_READ or
    WOLFSSL_CBIO_ERR_WANT_WRITE. WolfSSL keeps any partially sent
    record in its own output buffer and returns
    WOLFSSL_ERROR_WANT_*; the session reports suspended and the
    caller repeats the same call later.

    WolfSSL Context Initialization
    ------------------------------
    Standard WolfSSL builds expose separate client and server
    methods rather than a combined one, so the cached native
    context holds one WOLFSSL_CTX per role.
*/

namespace boost::nbtls::tls {

namespace {

struct wolfssl_category_impl
    : system::error_category
{
    char const*
    name() const noexcept override
    {
        return "boost.nbtls.wolfssl";
    }

    std::string
    message( int ev ) const override
    {
        char buf[WOLFSSL_MAX_ERROR_SZ];
        wolfSSL_ERR_error_string_n(
            static_cast<unsigned long>( ev ), buf, sizeof( buf ) );
        return buf;
    }

    system::error_condition
    default_error_condition( int ) const noexcept override
    {
        return condition::protocol_failure;
    }
};

system::error_code
make_wolfssl_error( int err ) noexcept
{
    return system::error_code( err, wolfssl_category() );
}

} // namespace

//------------------------------------------------------------------------------
//
// Native context caching
//
//------------------------------------------------------------------------------

namespace detail {

/** Cached WolfSSL contexts owning WOLFSSL_CTX for client and server.

    Created the first time the engine prepares a tls::context,
    then reused for every session created from that context.
*/
class wolfssl_native_context
    : public native_context_base
{
public:
    WOLFSSL_CTX* client_ctx_ = nullptr;
    WOLFSSL_CTX* server_ctx_ = nullptr;
    system::error_code ec_;

    explicit
    wolfssl_native_context( context_data const& cd )
    {
        bool const tls12_only = cd.max_version == version::tls_1_2;
        client_ctx_ = wolfSSL_CTX_new( tls12_only
            ? wolfTLSv1_2_client_method()
            : wolfTLS_client_method() );
        server_ctx_ = wolfSSL_CTX_new( tls12_only
            ? wolfTLSv1_2_server_method()
            : wolfTLS_server_method() );

        if( !client_ctx_ || !server_ctx_ )
        {
            fail( "wolfSSL_CTX_new", 0 );
            return;
        }

        if( cd.servername_callback )
            nbtls::detail::log().warn(
                "wolfssl: server name callback is not supported" );

        if( apply_common_settings( client_ctx_, cd ) )
            apply_common_settings( server_ctx_, cd );
    }

    ~wolfssl_native_context() override
    {
        if( client_ctx_ )
            wolfSSL_CTX_free( client_ctx_ );
        if( server_ctx_ )
            wolfSSL_CTX_free( server_ctx_ );
    }

private:
    bool
    fail( char const* what, int ret )
    {
        nbtls::detail::log().warn( "wolfssl: {}: {}", what,
            ret != 0
                ? make_wolfssl_error( ret ).message()
                : std::string( "no detail" ) );
        ec_ = make_error_code( error::setup_failed );
        return false;
    }

    bool
    apply_common_settings( WOLFSSL_CTX* ctx, context_data const& cd )
    {
        int ret;

        if( cd.min_version == version::tls_1_3 )
        {
            ret = wolfSSL_CTX_SetMinVersion( ctx, WOLFSSL_TLSV1_3 );
            if( ret != WOLFSSL_SUCCESS )
                return fail( "protocol version", ret );
        }

        int verify_mode_flag = WOLFSSL_VERIFY_NONE;
        if( cd.verification_mode == verify_mode::peer )
            verify_mode_flag = WOLFSSL_VERIFY_PEER;
        else if( cd.verification_mode == verify_mode::require_peer )
            verify_mode_flag = WOLFSSL_VERIFY_PEER | WOLFSSL_VERIFY_FAIL_IF_NO_PEER_CERT;
        wolfSSL_CTX_set_verify( ctx, verify_mode_flag, nullptr );
        wolfSSL_CTX_set_verify_depth( ctx, cd.verify_depth );

        if( !cd.entity_certificate.empty() )
        {
            int format = ( cd.entity_cert_format == file_format::pem )
                ? WOLFSSL_FILETYPE_PEM : WOLFSSL_FILETYPE_ASN1;
            ret = wolfSSL_CTX_use_certificate_buffer( ctx,
                reinterpret_cast<unsigned char const*>( cd.entity_certificate.data() ),
                static_cast<long>( cd.entity_certificate.size() ),
                format );
            if( ret != WOLFSSL_SUCCESS )
                return fail( "certificate", ret );
        }

        if( !cd.certificate_chain.empty() )
        {
            ret = wolfSSL_CTX_use_certificate_chain_buffer( ctx,
                reinterpret_cast<unsigned char const*>( cd.certificate_chain.data() ),
                static_cast<long>( cd.certificate_chain.size() ) );
            if( ret != WOLFSSL_SUCCESS )
                return fail( "certificate chain", ret );
        }

        if( !cd.private_key.empty() )
        {
            int format = ( cd.private_key_format == file_format::pem )
                ? WOLFSSL_FILETYPE_PEM : WOLFSSL_FILETYPE_ASN1;
            ret = wolfSSL_CTX_use_PrivateKey_buffer( ctx,
                reinterpret_cast<unsigned char const*>( cd.private_key.data() ),
                static_cast<long>( cd.private_key.size() ),
                format );
            if( ret != WOLFSSL_SUCCESS )
                return fail( "private key", ret );

#ifndef NO_CHECK_PRIVATE_KEY
            if( !cd.entity_certificate.empty() ||
                !cd.certificate_chain.empty() )
            {
                ret = wolfSSL_CTX_check_private_key( ctx );
                if( ret != WOLFSSL_SUCCESS )
                    return fail( "private key does not match certificate", ret );
            }
#endif
        }

        for( auto const& ca : cd.ca_certificates )
        {
            ret = wolfSSL_CTX_load_verify_buffer( ctx,
                reinterpret_cast<unsigned char const*>( ca.data() ),
                static_cast<long>( ca.size() ),
                WOLFSSL_FILETYPE_PEM );
            if( ret != WOLFSSL_SUCCESS )
                return fail( "certificate authority", ret );
        }

        for( auto const& path : cd.verify_paths )
        {
            ret = wolfSSL_CTX_load_verify_locations( ctx, nullptr, path.c_str() );
            if( ret != WOLFSSL_SUCCESS )
                return fail( "verify path", ret );
        }

        if( cd.use_default_verify_paths )
        {
#ifdef WOLFSSL_SYS_CA_CERTS
            ret = wolfSSL_CTX_load_system_CA_certs( ctx );
            if( ret != WOLFSSL_SUCCESS )
                return fail( "default verify paths", ret );
#else
            return fail( "default verify paths require WOLFSSL_SYS_CA_CERTS", 0 );
#endif
        }

        if( !cd.ciphersuites.empty() )
        {
            ret = wolfSSL_CTX_set_cipher_list( ctx, cd.ciphersuites.c_str() );
            if( ret != WOLFSSL_SUCCESS )
                return fail( "cipher list", ret );
        }
        return true;
    }
};

/** Get or create the cached native context for a context.

    @param cd The context implementation.
*/
inline wolfssl_native_context const*
get_wolfssl_context( context_data const& cd )
{
    static char key;
    auto* p = cd.find( &key, [&]
    {
        return std::make_unique<wolfssl_native_context>( cd );
    });
    return static_cast<wolfssl_native_context const*>( p );
}

} // namespace detail

//------------------------------------------------------------------------------

namespace {

class wolfssl_session
    : public session
{
    context ctx_;   // holds ref to cached native context
    std::unique_ptr<transport> next_;
    WOLFSSL* ssl_ = nullptr;
    tls::role role_;

    // Set by the I/O callbacks during one WolfSSL call
    want interest_ = want::read;
    system::error_code transport_ec_;
    bool transport_eof_ = false;

    // The transport ended; no close-notify can be exchanged
    bool peer_closed_ = false;

#ifdef HAVE_ALPN
    std::string alpn_list_;
#endif

public:
    wolfssl_session(
        context ctx,
        std::unique_ptr<transport> next,
        tls::role r )
        : ctx_( std::move( ctx ) )
        , next_( std::move( next ) )
        , role_( r )
    {
    }

    ~wolfssl_session()
    {
        if( ssl_ )
            wolfSSL_free( ssl_ );
    }

    system::error_code
    init(
        WOLFSSL_CTX* native_ctx,
        detail::context_data const& cd,
        session_params const& params )
    {
        ssl_ = wolfSSL_new( native_ctx );
        if( !ssl_ )
            return setup_error( "wolfSSL_new", 0 );

        wolfSSL_SSLSetIORecv( ssl_, &recv_callback );
        wolfSSL_SSLSetIOSend( ssl_, &send_callback );
        wolfSSL_SetIOReadCtx( ssl_, this );
        wolfSSL_SetIOWriteCtx( ssl_, this );

        if( role_ == role::client && !params.hostname.empty() )
        {
            int ret;
#ifdef HAVE_SNI
            if( params.use_sni )
            {
                ret = wolfSSL_UseSNI( ssl_, WOLFSSL_SNI_HOST_NAME,
                    params.hostname.data(),
                    static_cast<unsigned short>( params.hostname.size() ) );
                if( ret != WOLFSSL_SUCCESS )
                    return setup_error( "wolfSSL_UseSNI", ret );
            }
#endif
            if( params.verify_hostname )
            {
                ret = wolfSSL_check_domain_name( ssl_, params.hostname.c_str() );
                if( ret != WOLFSSL_SUCCESS )
                    return setup_error( "wolfSSL_check_domain_name", ret );
            }
        }

#ifdef HAVE_ALPN
        if( !cd.alpn_protocols.empty() )
        {
            for( auto const& p : cd.alpn_protocols )
            {
                if( !alpn_list_.empty() )
                    alpn_list_.push_back( ',' );
                alpn_list_.append( p );
            }
            int ret = wolfSSL_UseALPN( ssl_, alpn_list_.data(),
                static_cast<unsigned int>( alpn_list_.size() ),
                WOLFSSL_ALPN_FAILED_ON_MISMATCH );
            if( ret != WOLFSSL_SUCCESS )
                return setup_error( "wolfSSL_UseALPN", ret );
        }
#else
        if( !cd.alpn_protocols.empty() )
            return setup_error( "ALPN requires HAVE_ALPN", 0 );
#endif
        return {};
    }

    //--------------------------------------------------------------------------

    poll_result<>
    handshake() override
    {
        begin_call();
        int ret = ( role_ == role::client )
            ? wolfSSL_connect( ssl_ )
            : wolfSSL_accept( ssl_ );
        if( ret == WOLFSSL_SUCCESS )
            return {};

        auto r = classify( ret );
        if( r.failed() && r.error() == error::eof )
            return make_error_code( error::stream_truncated );
        return r;
    }

    poll_result<std::size_t>
    read_some( mutable_buffer buf ) override
    {
        begin_call();
        int ret = wolfSSL_read( ssl_, buf.data(), clamp( buf.size() ) );
        if( ret > 0 )
            return static_cast<std::size_t>( ret );

        int err = wolfSSL_get_error( ssl_, ret );
        if( err == WOLFSSL_ERROR_ZERO_RETURN )
            return make_error_code( error::eof );

        auto r = classify( ret );
        if( r.suspended() )
            return would_block{ r.interest() };
        if( r.error() == error::eof )
            return make_error_code( error::stream_truncated );
        return r.error();
    }

    poll_result<std::size_t>
    write_some( const_buffer buf ) override
    {
        begin_call();
        int ret = wolfSSL_write( ssl_, buf.data(), clamp( buf.size() ) );
        if( ret > 0 )
            return static_cast<std::size_t>( ret );

        auto r = classify( ret );
        if( r.suspended() )
            return would_block{ r.interest() };
        return r.error();
    }

    // The send callback writes straight to the transport
    poll_result<>
    flush() override
    {
        return next_->flush();
    }

    poll_result<shutdown_state>
    shutdown() override
    {
        if( peer_closed_ )
            return make_error_code( error::eof );

        begin_call();
        int ret = wolfSSL_shutdown( ssl_ );
        if( ret == WOLFSSL_SUCCESS )
            return shutdown_state::received;
        if( ret == WOLFSSL_SHUTDOWN_NOT_DONE )
            return shutdown_state::sent;

        auto r = classify( ret );
        if( r.suspended() )
            return would_block{ r.interest() };
        return r.error();
    }

    transport&
    next_layer() noexcept override
    {
        return *next_;
    }

    std::string_view
    alpn_protocol() const noexcept override
    {
#ifdef HAVE_ALPN
        char* name = nullptr;
        unsigned short size = 0;
        if( wolfSSL_ALPN_GetProtocol( ssl_, &name, &size ) == WOLFSSL_SUCCESS && name )
            return std::string_view( name, size );
#endif
        return {};
    }

    void*
    native_handle() noexcept override
    {
        return ssl_;
    }

private:
    static int
    clamp( std::size_t n ) noexcept
    {
        return n > static_cast<std::size_t>( INT_MAX )
            ? INT_MAX : static_cast<int>( n );
    }

    system::error_code
    setup_error( char const* what, int ret )
    {
        nbtls::detail::log().warn( "wolfssl: {}: {}", what,
            ret != 0
                ? make_wolfssl_error( ret ).message()
                : std::string( "no detail" ) );
        return make_error_code( error::setup_failed );
    }

    void
    begin_call() noexcept
    {
        interest_ = want::read;
        transport_ec_ = {};
        transport_eof_ = false;
    }

    // Turn a failed WolfSSL return into suspension or an error.
    // A clean end of the transport is reported as error::eof.
    poll_result<>
    classify( int ret )
    {
        int err = wolfSSL_get_error( ssl_, ret );
        if( err == WOLFSSL_ERROR_WANT_READ ||
            err == WOLFSSL_ERROR_WANT_WRITE )
            return would_block{ interest_ };
        if( transport_ec_ )
            return transport_ec_;
        if( transport_eof_ || err == WOLFSSL_ERROR_ZERO_RETURN )
            return make_error_code( error::eof );
        return make_wolfssl_error( err );
    }

    // Callback invoked by WolfSSL when it needs to receive data
    static int
    recv_callback( WOLFSSL*, char* buf, int sz, void* ctx )
    {
        auto* self = static_cast<wolfssl_session*>( ctx );
        auto r = self->next_->read_some( mutable_buffer(
            buf, static_cast<std::size_t>( sz ) ) );
        if( r.ready() )
            return static_cast<int>( *r );
        if( r.suspended() )
        {
            self->interest_ = r.interest();
            return WOLFSSL_CBIO_ERR_WANT_READ;
        }
        if( r.error() == error::eof )
        {
            self->transport_eof_ = true;
            self->peer_closed_ = true;
            return WOLFSSL_CBIO_ERR_CONN_CLOSE;
        }
        self->transport_ec_ = r.error();
        return WOLFSSL_CBIO_ERR_GENERAL;
    }

    // Callback invoked by WolfSSL when it needs to send data
    static int
    send_callback( WOLFSSL*, char* buf, int sz, void* ctx )
    {
        auto* self = static_cast<wolfssl_session*>( ctx );
        auto r = self->next_->write_some( const_buffer(
            buf, static_cast<std::size_t>( sz ) ) );
        if( r.ready() )
            return static_cast<int>( *r );
        if( r.suspended() )
        {
            self->interest_ = r.interest();
            return WOLFSSL_CBIO_ERR_WANT_WRITE;
        }
        self->transport_ec_ = r.error();
        return WOLFSSL_CBIO_ERR_GENERAL;
    }
};

//------------------------------------------------------------------------------

class wolfssl_engine_impl
    : public engine
{
public:
    wolfssl_engine_impl()
    {
        int ret = wolfSSL_Init();
        if( ret != WOLFSSL_SUCCESS )
            nbtls::detail::log().error(
                "wolfssl: wolfSSL_Init: {}",
                make_wolfssl_error( ret ).message() );
    }

    ~wolfssl_engine_impl()
    {
        wolfSSL_Cleanup();
    }

    char const*
    name() const noexcept override
    {
        return "wolfssl";
    }

    system::error_code
    prepare( context const& ctx ) const override
    {
        return detail::get_wolfssl_context(
            detail::get_context_data( ctx ) )->ec_;
    }

    std::unique_ptr<session>
    make_session(
        context const& ctx,
        session_params const& params,
        std::unique_ptr<transport> next,
        system::error_code& ec ) const override
    {
        auto const& cd = detail::get_context_data( ctx );
        auto const* native = detail::get_wolfssl_context( cd );
        if( native->ec_ )
        {
            ec = native->ec_;
            return nullptr;
        }

        WOLFSSL_CTX* native_ctx = ( params.role == role::client )
            ? native->client_ctx_
            : native->server_ctx_;

        auto s = std::make_unique<wolfssl_session>(
            ctx, std::move( next ), params.role );
        ec = s->init( native_ctx, cd, params );
        if( ec )
            return nullptr;
        return s;
    }
};

} // namespace

engine const&
wolfssl_engine() noexcept
{
    static wolfssl_engine_impl const e;
    return e;
}

system::error_category const&
wolfssl_category() noexcept
{
    static wolfssl_category_impl const cat;
    return cat;
}

} // namespace boost::nbtls::tls
