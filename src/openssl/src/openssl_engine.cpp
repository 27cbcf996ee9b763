//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/tls/openssl.hpp>
#include <boost/nbtls/error.hpp>
#include "src/detail/log.hpp"

// Internal context implementation
#include "src/tls/detail/context_impl.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

/*
    openssl_session Architecture
    ============================

    The SSL object runs over one end of a BIO pair. The other end
    (ext_bio_) is pumped against the transport without blocking.

    Data Flow (using BIO pairs)
    ---------------------------
    App -> SSL_write_ex -> int_bio -> BIO_read(ext_bio_) -> out_buf_ -> next_->write_some -> Network
    App <- SSL_read_ex  <- int_bio <- BIO_write(ext_bio_) <- in_buf_ <- next_->read_some  <- Network

    WANT_READ / WANT_WRITE Pattern
    ------------------------------
    Each operation runs the SSL call in a loop:

      1. Call SSL_do_handshake, SSL_read_ex, SSL_write_ex or SSL_shutdown
      2. On SSL_ERROR_WANT_WRITE: drain ext_bio_ to the transport
      3. On SSL_ERROR_WANT_READ: drain ext_bio_, then move one read
         from the transport into ext_bio_
      4. Loop back to step 1

    When the transport would block in step 2 or 3 the operation
    returns suspended with the transport's readiness interest. All
    progress lives in the SSL object, the BIO pair and out_buf_, so
    the next call picks up where this one stopped.

    A successful SSL_write_ex is not reported until its records have
    been handed to the transport. The byte count is kept in written_
    so the retried call completes without encrypting the bytes again.
*/

namespace boost::nbtls::tls {

namespace {

// Default buffer size for transport I/O
constexpr std::size_t default_buffer_size = 16384;

struct openssl_category_impl
    : system::error_category
{
    char const*
    name() const noexcept override
    {
        return "boost.nbtls.openssl";
    }

    std::string
    message( int ev ) const override
    {
        char buf[256];
        ERR_error_string_n(
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
make_openssl_error( unsigned long err ) noexcept
{
    if( err == 0 )
        err = ERR_PACK( ERR_LIB_SSL, 0, ERR_R_INTERNAL_ERROR );
    return system::error_code(
        static_cast<int>( err ), openssl_category() );
}

bool
is_ip_literal( std::string const& host ) noexcept
{
    unsigned char buf[sizeof( in6_addr )];
    return inet_pton( AF_INET, host.c_str(), buf ) == 1 ||
        inet_pton( AF_INET6, host.c_str(), buf ) == 1;
}

int
to_native( version v ) noexcept
{
    return v == version::tls_1_3 ? TLS1_3_VERSION : TLS1_2_VERSION;
}

template<class T>
poll_result<T>
not_ready( poll_result<> const& r )
{
    if( r.suspended() )
        return would_block{ r.interest() };
    return r.error();
}

} // namespace

//------------------------------------------------------------------------------
//
// Native context caching
//
//------------------------------------------------------------------------------

namespace detail {

// Ex data index for storing the native context in SSL_CTX
int
native_context_index()
{
    static int const index = SSL_CTX_get_ex_new_index(
        0, nullptr, nullptr, nullptr, nullptr );
    return index;
}

/** Cached OpenSSL context owning SSL_CTX.

    Created the first time the engine prepares a tls::context,
    then reused for every session created from that context.
    Configuration errors are kept in ec_ and reported by every
    later prepare or make_session.
*/
class openssl_native_context
    : public native_context_base
{
public:
    SSL_CTX* ctx_ = nullptr;
    system::error_code ec_;
    context_data const& cd_;

    // Server ALPN preference list in wire format
    std::vector<unsigned char> alpn_;

    explicit
    openssl_native_context( context_data const& cd )
        : cd_( cd )
    {
        if( !build() && ctx_ )
        {
            SSL_CTX_free( ctx_ );
            ctx_ = nullptr;
        }
    }

    ~openssl_native_context() override
    {
        if( ctx_ )
            SSL_CTX_free( ctx_ );
    }

    static
    openssl_native_context const*
    from( SSL* ssl ) noexcept
    {
        return static_cast<openssl_native_context const*>(
            SSL_CTX_get_ex_data(
                SSL_get_SSL_CTX( ssl ), native_context_index() ) );
    }

private:
    bool
    fail( char const* what )
    {
        char buf[256] = "no detail";
        unsigned long err = ERR_get_error();
        if( err != 0 )
            ERR_error_string_n( err, buf, sizeof( buf ) );
        ERR_clear_error();
        nbtls::detail::log().warn( "openssl: {}: {}", what, buf );
        ec_ = make_error_code( error::setup_failed );
        return false;
    }

    bool
    build()
    {
        ERR_clear_error();

        // Create SSL_CTX supporting both client and server
        ctx_ = SSL_CTX_new( TLS_method() );
        if( !ctx_ )
            return fail( "SSL_CTX_new" );

        if( SSL_CTX_set_ex_data( ctx_, native_context_index(), this ) != 1 )
            return fail( "SSL_CTX_set_ex_data" );

        if( cd_.servername_callback )
            SSL_CTX_set_tlsext_servername_callback( ctx_, servername_callback );

        SSL_CTX_set_mode( ctx_, SSL_MODE_ENABLE_PARTIAL_WRITE );
        SSL_CTX_set_mode( ctx_, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER );
#if defined( SSL_MODE_RELEASE_BUFFERS )
        SSL_CTX_set_mode( ctx_, SSL_MODE_RELEASE_BUFFERS );
#endif

        if( SSL_CTX_set_min_proto_version( ctx_, to_native( cd_.min_version ) ) != 1 ||
            SSL_CTX_set_max_proto_version( ctx_, to_native( cd_.max_version ) ) != 1 )
            return fail( "protocol version" );

        int verify_mode_flag = SSL_VERIFY_NONE;
        if( cd_.verification_mode == verify_mode::peer )
            verify_mode_flag = SSL_VERIFY_PEER;
        else if( cd_.verification_mode == verify_mode::require_peer )
            verify_mode_flag = SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
        SSL_CTX_set_verify( ctx_, verify_mode_flag, nullptr );
        SSL_CTX_set_verify_depth( ctx_, cd_.verify_depth );

        return
            use_certificate() &&
            use_certificate_chain() &&
            use_private_key() &&
            use_trust_anchors() &&
            use_ciphersuites() &&
            use_alpn();
    }

    bool
    use_certificate()
    {
        if( cd_.entity_certificate.empty() )
            return true;

        BIO* bio = BIO_new_mem_buf(
            cd_.entity_certificate.data(),
            static_cast<int>( cd_.entity_certificate.size() ) );
        if( !bio )
            return fail( "BIO_new_mem_buf" );

        X509* cert = nullptr;
        if( cd_.entity_cert_format == file_format::pem )
            cert = PEM_read_bio_X509( bio, nullptr, nullptr, nullptr );
        else
            cert = d2i_X509_bio( bio, nullptr );
        BIO_free( bio );
        if( !cert )
            return fail( "certificate" );

        int ok = SSL_CTX_use_certificate( ctx_, cert );
        X509_free( cert );
        if( ok != 1 )
            return fail( "SSL_CTX_use_certificate" );
        return true;
    }

    // First cert is the entity, the rest are intermediates
    bool
    use_certificate_chain()
    {
        if( cd_.certificate_chain.empty() )
            return true;

        BIO* bio = BIO_new_mem_buf(
            cd_.certificate_chain.data(),
            static_cast<int>( cd_.certificate_chain.size() ) );
        if( !bio )
            return fail( "BIO_new_mem_buf" );

        X509* entity = PEM_read_bio_X509( bio, nullptr, nullptr, nullptr );
        if( !entity )
        {
            BIO_free( bio );
            return fail( "certificate chain" );
        }
        int ok = SSL_CTX_use_certificate( ctx_, entity );
        X509_free( entity );
        if( ok != 1 )
        {
            BIO_free( bio );
            return fail( "SSL_CTX_use_certificate" );
        }

        X509* cert;
        while( ( cert = PEM_read_bio_X509( bio, nullptr, nullptr, nullptr ) ) != nullptr )
        {
            // Takes ownership on success
            if( SSL_CTX_add_extra_chain_cert( ctx_, cert ) != 1 )
            {
                X509_free( cert );
                BIO_free( bio );
                return fail( "SSL_CTX_add_extra_chain_cert" );
            }
        }
        // Expected EOF from reading the end of the chain
        ERR_clear_error();
        BIO_free( bio );
        return true;
    }

    bool
    use_private_key()
    {
        if( cd_.private_key.empty() )
            return true;

        BIO* bio = BIO_new_mem_buf(
            cd_.private_key.data(),
            static_cast<int>( cd_.private_key.size() ) );
        if( !bio )
            return fail( "BIO_new_mem_buf" );

        EVP_PKEY* pkey = nullptr;
        if( cd_.private_key_format == file_format::pem )
            pkey = PEM_read_bio_PrivateKey( bio, nullptr, nullptr, nullptr );
        else
            pkey = d2i_PrivateKey_bio( bio, nullptr );
        BIO_free( bio );
        if( !pkey )
            return fail( "private key" );

        int ok = SSL_CTX_use_PrivateKey( ctx_, pkey );
        EVP_PKEY_free( pkey );
        if( ok != 1 )
            return fail( "SSL_CTX_use_PrivateKey" );

        if( SSL_CTX_get0_certificate( ctx_ ) &&
            SSL_CTX_check_private_key( ctx_ ) != 1 )
            return fail( "private key does not match certificate" );
        return true;
    }

    bool
    use_trust_anchors()
    {
        X509_STORE* store = SSL_CTX_get_cert_store( ctx_ );
        for( auto const& ca : cd_.ca_certificates )
        {
            BIO* bio = BIO_new_mem_buf( ca.data(), static_cast<int>( ca.size() ) );
            if( !bio )
                return fail( "BIO_new_mem_buf" );

            // A bundle may hold several certificates
            int count = 0;
            X509* cert;
            while( ( cert = PEM_read_bio_X509( bio, nullptr, nullptr, nullptr ) ) != nullptr )
            {
                int ok = X509_STORE_add_cert( store, cert );
                X509_free( cert );
                if( ok != 1 )
                {
                    BIO_free( bio );
                    return fail( "X509_STORE_add_cert" );
                }
                ++count;
            }
            BIO_free( bio );
            if( count == 0 )
                return fail( "certificate authority" );
            ERR_clear_error();
        }

        for( auto const& path : cd_.verify_paths )
            if( SSL_CTX_load_verify_locations( ctx_, nullptr, path.c_str() ) != 1 )
                return fail( "verify path" );

        if( cd_.use_default_verify_paths &&
            SSL_CTX_set_default_verify_paths( ctx_ ) != 1 )
            return fail( "default verify paths" );
        return true;
    }

    bool
    use_ciphersuites()
    {
        if( cd_.ciphersuites.empty() )
            return true;
        SSL_CTX_set_security_level( ctx_, 0 );
        if( SSL_CTX_set_cipher_list( ctx_, cd_.ciphersuites.c_str() ) != 1 )
            return fail( "cipher list" );
        return true;
    }

    bool
    use_alpn()
    {
        if( cd_.alpn_protocols.empty() )
            return true;

        for( auto const& p : cd_.alpn_protocols )
        {
            if( p.empty() || p.size() > 255 )
                return fail( "ALPN protocol name" );
            alpn_.push_back( static_cast<unsigned char>( p.size() ) );
            alpn_.insert( alpn_.end(), p.begin(), p.end() );
        }

        // Returns zero on success
        if( SSL_CTX_set_alpn_protos( ctx_,
                alpn_.data(), static_cast<unsigned int>( alpn_.size() ) ) != 0 )
            return fail( "SSL_CTX_set_alpn_protos" );
        SSL_CTX_set_alpn_select_cb( ctx_, alpn_select_callback, nullptr );
        return true;
    }

    // SNI callback invoked by OpenSSL during a server handshake
    static int
    servername_callback( SSL* ssl, int* /* alert */, void* /* arg */ )
    {
        char const* servername = SSL_get_servername( ssl, TLSEXT_NAMETYPE_host_name );
        if( !servername )
            return SSL_TLSEXT_ERR_NOACK;

        auto const* native = from( ssl );
        if( native && native->cd_.servername_callback &&
            !native->cd_.servername_callback( servername ) )
        {
            nbtls::detail::log().debug(
                "openssl: server name {} rejected", servername );
            return SSL_TLSEXT_ERR_ALERT_FATAL;
        }
        return SSL_TLSEXT_ERR_OK;
    }

    // Pick the first server protocol which the client offered
    static int
    alpn_select_callback(
        SSL* ssl,
        unsigned char const** out,
        unsigned char* outlen,
        unsigned char const* in,
        unsigned int inlen,
        void* /* arg */ )
    {
        auto const* native = from( ssl );
        if( !native || native->alpn_.empty() )
            return SSL_TLSEXT_ERR_NOACK;

        unsigned char* selected = nullptr;
        if( SSL_select_next_proto( &selected, outlen,
                native->alpn_.data(),
                static_cast<unsigned int>( native->alpn_.size() ),
                in, inlen ) != OPENSSL_NPN_NEGOTIATED )
            return SSL_TLSEXT_ERR_ALERT_FATAL;
        *out = selected;
        return SSL_TLSEXT_ERR_OK;
    }
};

/** Get or create the cached native context for a context.

    @param cd The context implementation.
*/
inline openssl_native_context const*
get_openssl_context( context_data const& cd )
{
    static char key;
    auto* p = cd.find( &key, [&]
    {
        return std::make_unique<openssl_native_context>( cd );
    });
    return static_cast<openssl_native_context const*>( p );
}

} // namespace detail

//------------------------------------------------------------------------------

namespace {

class openssl_session
    : public session
{
    context ctx_;   // holds ref to cached native context
    std::unique_ptr<transport> next_;
    SSL* ssl_ = nullptr;
    BIO* ext_bio_ = nullptr;

    std::vector<unsigned char> in_buf_;
    std::vector<unsigned char> out_buf_;
    std::size_t out_pos_ = 0;
    std::size_t out_len_ = 0;

    // Plaintext accepted by SSL_write_ex but not yet on the transport
    std::size_t written_ = 0;

public:
    openssl_session(
        context ctx,
        std::unique_ptr<transport> next )
        : ctx_( std::move( ctx ) )
        , next_( std::move( next ) )
        , in_buf_( default_buffer_size )
        , out_buf_( default_buffer_size )
    {
    }

    ~openssl_session()
    {
        if( ext_bio_ )
            BIO_free( ext_bio_ );
        if( ssl_ )
            SSL_free( ssl_ );
        // SSL_CTX* is owned by the cached native context
    }

    system::error_code
    init(
        SSL_CTX* native_ctx,
        session_params const& params )
    {
        ERR_clear_error();

        ssl_ = SSL_new( native_ctx );
        if( !ssl_ )
            return setup_error( "SSL_new" );

        BIO* int_bio = nullptr;
        if( !BIO_new_bio_pair( &int_bio, 0, &ext_bio_, 0 ) )
            return setup_error( "BIO_new_bio_pair" );

        // SSL takes ownership of the internal BIO
        SSL_set_bio( ssl_, int_bio, int_bio );

        if( params.role == role::client )
        {
            SSL_set_connect_state( ssl_ );

            auto const& host = params.hostname;
            bool const ip = is_ip_literal( host );

            // SNI carries DNS names only
            if( params.use_sni && !host.empty() && !ip &&
                SSL_set_tlsext_host_name( ssl_, host.c_str() ) != 1 )
                return setup_error( "SSL_set_tlsext_host_name" );

            if( params.verify_hostname && !host.empty() )
            {
                int ok = ip
                    ? X509_VERIFY_PARAM_set1_ip_asc(
                        SSL_get0_param( ssl_ ), host.c_str() )
                    : SSL_set1_host( ssl_, host.c_str() );
                if( ok != 1 )
                    return setup_error( "hostname verification" );
            }
        }
        else
        {
            SSL_set_accept_state( ssl_ );
        }
        return {};
    }

    //--------------------------------------------------------------------------

    poll_result<>
    handshake() override
    {
        auto r = drive( [this]
        {
            return SSL_do_handshake( ssl_ );
        });
        if( r.failed() )
        {
            auto ec = r.error();
            long v = SSL_get_verify_result( ssl_ );
            if( v != X509_V_OK )
                nbtls::detail::log().debug( "openssl: verify failed: {}",
                    X509_verify_cert_error_string( v ) );
            if( ec == error::eof )
                ec = make_error_code( error::stream_truncated );
            return ec;
        }
        if( r.suspended() )
            return r;

        // Deliver the final flight before reporting completion
        return flush_output();
    }

    poll_result<std::size_t>
    read_some( mutable_buffer buf ) override
    {
        std::size_t n = 0;
        auto r = drive( [&]
        {
            return SSL_read_ex( ssl_, buf.data(), buf.size(), &n );
        });
        if( r.failed() )
        {
            auto ec = r.error();
            if( ec == error::eof &&
                !( SSL_get_shutdown( ssl_ ) & SSL_RECEIVED_SHUTDOWN ) )
                ec = make_error_code( error::stream_truncated );
            return ec;
        }
        if( r.suspended() )
            return would_block{ r.interest() };

        // Reading may produce records for the peer, such as a key
        // update. They stay queued if the transport is not ready.
        // Bytes already read are delivered; a transport failure
        // is reported by the next call.
        auto f = flush_output();
        if( f.failed() )
            nbtls::detail::log().debug(
                "openssl: flush after read failed: {}",
                f.error().message() );
        return n;
    }

    poll_result<std::size_t>
    write_some( const_buffer buf ) override
    {
        if( written_ == 0 )
        {
            std::size_t n = 0;
            auto r = drive( [&]
            {
                return SSL_write_ex( ssl_, buf.data(), buf.size(), &n );
            });
            if( !r.ready() )
                return not_ready<std::size_t>( r );
            written_ = n;
        }

        auto f = flush_output();
        if( f.failed() )
        {
            written_ = 0;
            return f.error();
        }
        if( f.suspended() )
            return would_block{ f.interest() };
        return std::exchange( written_, 0 );
    }

    poll_result<>
    flush() override
    {
        auto r = flush_output();
        if( !r.ready() )
            return r;
        return next_->flush();
    }

    poll_result<shutdown_state>
    shutdown() override
    {
        for(;;)
        {
            ERR_clear_error();
            int ret = SSL_shutdown( ssl_ );

            if( ret == 1 || ret == 0 )
            {
                auto f = flush_output();
                if( !f.ready() )
                    return not_ready<shutdown_state>( f );
                return ret == 1
                    ? shutdown_state::received
                    : shutdown_state::sent;
            }

            int err = SSL_get_error( ssl_, ret );
            if( err == SSL_ERROR_WANT_WRITE ||
                err == SSL_ERROR_WANT_READ )
            {
                auto r = flush_output();
                if( r.ready() && err == SSL_ERROR_WANT_READ )
                    r = fill_input();
                if( !r.ready() )
                    return not_ready<shutdown_state>( r );
                continue;
            }
            if( err == SSL_ERROR_ZERO_RETURN )
                return shutdown_state::received;

            unsigned long ssl_err = ERR_get_error();
            if( ssl_err == 0 && err == SSL_ERROR_SYSCALL )
                return make_error_code( error::eof );
            return make_openssl_error( ssl_err );
        }
    }

    transport&
    next_layer() noexcept override
    {
        return *next_;
    }

    std::string_view
    alpn_protocol() const noexcept override
    {
        unsigned char const* data = nullptr;
        unsigned int len = 0;
        SSL_get0_alpn_selected( ssl_, &data, &len );
        if( !data )
            return {};
        return std::string_view(
            reinterpret_cast<char const*>( data ), len );
    }

    void*
    native_handle() noexcept override
    {
        return ssl_;
    }

private:
    system::error_code
    setup_error( char const* what )
    {
        char buf[256] = "no detail";
        unsigned long err = ERR_get_error();
        if( err != 0 )
            ERR_error_string_n( err, buf, sizeof( buf ) );
        ERR_clear_error();
        nbtls::detail::log().warn( "openssl: {}: {}", what, buf );
        return make_error_code( error::setup_failed );
    }

    // Run an SSL call until it succeeds, fails, or the transport
    // is not ready. The call returns a positive value on success.
    template<class Op>
    poll_result<>
    drive( Op const& op )
    {
        for(;;)
        {
            ERR_clear_error();
            int ret = op();
            if( ret > 0 )
                return {};

            int err = SSL_get_error( ssl_, ret );
            switch( err )
            {
            case SSL_ERROR_WANT_WRITE:
            {
                auto r = flush_output();
                if( !r.ready() )
                    return r;
                continue;
            }

            case SSL_ERROR_WANT_READ:
            {
                auto r = flush_output();
                if( !r.ready() )
                    return r;
                r = fill_input();
                if( !r.ready() )
                    return r;
                continue;
            }

            case SSL_ERROR_ZERO_RETURN:
                return make_error_code( error::eof );

            case SSL_ERROR_SYSCALL:
            {
                unsigned long ssl_err = ERR_get_error();
                if( ssl_err == 0 )
                    return make_error_code( error::stream_truncated );
                return make_openssl_error( ssl_err );
            }

            default:
                return make_openssl_error( ERR_get_error() );
            }
        }
    }

    // Move encrypted bytes from ext_bio_ to the transport
    poll_result<>
    flush_output()
    {
        for(;;)
        {
            if( out_pos_ == out_len_ )
            {
                int n = BIO_read( ext_bio_, out_buf_.data(),
                    static_cast<int>( out_buf_.size() ) );
                if( n <= 0 )
                    return {};
                out_pos_ = 0;
                out_len_ = static_cast<std::size_t>( n );
            }

            auto r = next_->write_some( const_buffer(
                out_buf_.data() + out_pos_, out_len_ - out_pos_ ) );
            if( !r.ready() )
            {
                if( r.suspended() )
                    return would_block{ r.interest() };
                return r.error();
            }
            out_pos_ += *r;
        }
    }

    // Move one read from the transport into ext_bio_
    poll_result<>
    fill_input()
    {
        std::size_t space = BIO_ctrl_get_write_guarantee( ext_bio_ );
        if( space == 0 )
            return make_error_code( system::errc::no_buffer_space );

        auto r = next_->read_some( mutable_buffer(
            in_buf_.data(), (std::min)( space, in_buf_.size() ) ) );
        if( !r.ready() )
        {
            if( r.suspended() )
                return would_block{ r.interest() };
            return r.error();
        }

        int n = BIO_write( ext_bio_, in_buf_.data(), static_cast<int>( *r ) );
        if( n != static_cast<int>( *r ) )
            return make_openssl_error( ERR_get_error() );
        return {};
    }
};

//------------------------------------------------------------------------------

class openssl_engine_impl
    : public engine
{
public:
    char const*
    name() const noexcept override
    {
        return "openssl";
    }

    system::error_code
    prepare( context const& ctx ) const override
    {
        return detail::get_openssl_context(
            detail::get_context_data( ctx ) )->ec_;
    }

    std::unique_ptr<session>
    make_session(
        context const& ctx,
        session_params const& params,
        std::unique_ptr<transport> next,
        system::error_code& ec ) const override
    {
        auto const* native = detail::get_openssl_context(
            detail::get_context_data( ctx ) );
        if( native->ec_ )
        {
            ec = native->ec_;
            return nullptr;
        }

        auto s = std::make_unique<openssl_session>( ctx, std::move( next ) );
        ec = s->init( native->ctx_, params );
        if( ec )
            return nullptr;
        return s;
    }
};

} // namespace

engine const&
openssl_engine() noexcept
{
    static openssl_engine_impl const e;
    return e;
}

system::error_category const&
openssl_category() noexcept
{
    static openssl_category_impl const cat;
    return cat;
}

} // namespace boost::nbtls::tls
