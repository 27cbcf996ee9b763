//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TLS_CONTEXT_HPP
#define BOOST_NBTLS_TLS_CONTEXT_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/system/error_code.hpp>

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace boost::nbtls::tls {

//------------------------------------------------------------------------------
//
// Enumerations
//
//------------------------------------------------------------------------------

/** The side of the handshake a session performs.

    @see connect
    @see accept
*/
enum class role
{
    /// The side which initiated the connection.
    client,

    /// The side which accepted the connection.
    server
};

/** TLS protocol version.

    @see context::set_min_protocol_version
    @see context::set_max_protocol_version
*/
enum class version
{
    /// TLS 1.2 (RFC 5246).
    tls_1_2,

    /// TLS 1.3 (RFC 8446).
    tls_1_3
};

/** Certificate and key encoding.

    @see context::use_certificate
    @see context::use_private_key
*/
enum class file_format
{
    /// Base64 with header and footer lines.
    pem,

    /// Raw ASN.1.
    der
};

/** Peer certificate verification mode.

    @see context::set_verify_mode
*/
enum class verify_mode
{
    /// Do not request or verify the peer certificate.
    none,

    /// Verify the peer certificate if one is presented.
    peer,

    /// Require a peer certificate and verify it.
    require_peer
};

class context;

namespace detail {
struct context_data;
context_data const&
get_context_data( context const& ) noexcept;
} // namespace detail

/** Portable configuration for secure sessions.

    A context stores credentials, trust anchors, protocol settings
    and verification options. Engines translate it into their own
    native configuration the first time a session is created from
    it, and cache the result inside the context.

    This class is a shared handle. Copies refer to the same
    configuration, so a context can be passed by value to every
    connect or accept call which uses it.

    Setters only record values. Malformed certificates or keys,
    or a key which does not match its certificate, are reported
    as @ref error::setup_failed when an engine prepares the
    context.

    @par Modification After Use

    Modifying a context after an engine prepared it has no
    effect on the engine's cached configuration. Create a new
    context for a different configuration.

    @par Thread Safety
    Distinct objects: Safe.@n
    Shared objects: Unsafe while being modified. Preparing a
    shared context from several threads is safe.

    @par Example
    @code
    tls::context ctx;
    ctx.set_default_verify_paths();
    ctx.set_verify_mode( tls::verify_mode::peer );
    @endcode
*/
class BOOST_NBTLS_DECL context
{
    struct impl;
    std::shared_ptr<impl> impl_;

    friend
    detail::context_data const&
    detail::get_context_data( context const& ) noexcept;

public:
    /** Construct a default context.

        The default allows TLS 1.2 and TLS 1.3, verifies nothing,
        and holds no credentials.
    */
    context();

    context( context const& other ) = default;
    context& operator=( context const& other ) = default;
    context( context&& other ) noexcept = default;
    context& operator=( context&& other ) noexcept = default;
    ~context() = default;

    //--------------------------------------------------------------------------
    //
    // Credential Loading
    //
    //--------------------------------------------------------------------------

    /** Set the certificate identifying this endpoint.

        @param certificate The certificate data.
        @param format The encoding of `certificate`.
    */
    void
    use_certificate(
        std::string_view certificate,
        file_format format );

    /** Load the certificate identifying this endpoint from a file.

        @return `errc::no_such_file_or_directory` if the file
            could not be read.
    */
    system::error_code
    use_certificate_file(
        std::string_view filename,
        file_format format );

    /** Set a PEM certificate chain.

        The first certificate identifies this endpoint, the
        rest are intermediates ordered towards the root.
    */
    void
    use_certificate_chain( std::string_view chain );

    /// Load a PEM certificate chain from a file.
    system::error_code
    use_certificate_chain_file( std::string_view filename );

    /** Set the private key matching the certificate.

        @param private_key The key data.
        @param format The encoding of `private_key`.
    */
    void
    use_private_key(
        std::string_view private_key,
        file_format format );

    /// Load the private key matching the certificate from a file.
    system::error_code
    use_private_key_file(
        std::string_view filename,
        file_format format );

    //--------------------------------------------------------------------------
    //
    // Trust Anchors
    //
    //--------------------------------------------------------------------------

    /** Trust a certificate authority.

        @param ca The CA certificate in PEM format.
    */
    void
    add_certificate_authority( std::string_view ca );

    /// Trust every PEM certificate in a file.
    system::error_code
    load_verify_file( std::string_view filename );

    /** Trust a directory of hashed CA certificates.

        The directory layout is the one produced by
        `openssl rehash`.
    */
    void
    add_verify_path( std::string_view path );

    /// Trust the system's default certificate store.
    void
    set_default_verify_paths();

    //--------------------------------------------------------------------------
    //
    // Protocol Configuration
    //
    //--------------------------------------------------------------------------

    void
    set_min_protocol_version( version v );

    void
    set_max_protocol_version( version v );

    /** Set the allowed cipher suites.

        The string uses OpenSSL cipher list syntax. A non-empty
        list also lowers the security level to zero, which
        permits anonymous suites such as `"aNULL:@SECLEVEL=0"`.
        An invalid list is reported as a setup failure.
    */
    void
    set_ciphersuites( std::string_view ciphers );

    /** Set the ALPN protocol list in preference order.

        A client offers these protocols. A server selects the
        first of its own protocols which the client offered, and
        rejects the handshake if there is none.

        @par Example
        @code
        ctx.set_alpn( { "h2", "http/1.1" } );
        @endcode

        @see stream::alpn_protocol
    */
    void
    set_alpn( std::initializer_list<std::string_view> protocols );

    //--------------------------------------------------------------------------
    //
    // Certificate Verification
    //
    //--------------------------------------------------------------------------

    void
    set_verify_mode( verify_mode mode );

    /// Set the maximum number of intermediate certificates.
    void
    set_verify_depth( int depth );

    /** Set a callback for Server Name Indication.

        A server invokes the callback during the handshake with
        the host name the client requested. Returning `false`
        aborts the handshake with a fatal alert.

        @tparam Callback A callable with signature
            `bool( std::string_view hostname )`.

        @par Example
        @code
        ctx.set_servername_callback(
            []( std::string_view hostname )
            {
                return hostname == "www.example.com";
            });
        @endcode
    */
    template<typename Callback>
    void
    set_servername_callback( Callback callback )
    {
        set_servername_callback_impl(
            std::function<bool( std::string_view )>(
                std::move( callback ) ) );
    }

private:
    void
    set_servername_callback_impl(
        std::function<bool( std::string_view )> callback );
};

} // namespace boost::nbtls::tls

#endif
