//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TLS_ENGINE_HPP
#define BOOST_NBTLS_TLS_ENGINE_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/buffers.hpp>
#include <boost/nbtls/poll_result.hpp>
#include <boost/nbtls/transport.hpp>
#include <boost/nbtls/tls/context.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace boost::nbtls::tls {

/** Progress reported by one step of a session shutdown.

    @see session::shutdown
*/
enum class shutdown_state
{
    /// Our close-notify was written. The peer's has not arrived.
    sent,

    /// The peer's close-notify was received.
    received
};

/** Per-connection parameters for creating a session.
*/
struct session_params
{
    /// The side of the handshake to perform.
    tls::role role = tls::role::client;

    /// The peer's name, used for SNI and hostname verification.
    std::string hostname;

    /// Send the hostname in the Server Name Indication extension.
    bool use_sni = true;

    /// Check the peer certificate against the hostname.
    bool verify_hostname = true;
};

/** A secure session provided by an engine.

    A session owns the transport it runs over. Every operation
    is non-blocking: it either completes, fails permanently, or
    returns a suspended result naming the readiness the
    transport must reach before the operation is invoked again.
    A suspended operation keeps its progress inside the session.

    Destroying a session releases the engine state and the
    transport without performing any further I/O.
*/
class BOOST_NBTLS_DECL session
{
public:
    virtual ~session() = default;

    /// Advance the handshake. Ready when the handshake is complete.
    virtual
    poll_result<>
    handshake() = 0;

    /** Read decrypted bytes.

        @return The number of bytes read; @ref error::eof if the
            peer sent close-notify; @ref error::stream_truncated
            if the transport ended without close-notify.
    */
    virtual
    poll_result<std::size_t>
    read_some( mutable_buffer buf ) = 0;

    /** Encrypt and send bytes.

        After a suspended result, the next call must pass at
        least the same bytes.
    */
    virtual
    poll_result<std::size_t>
    write_some( const_buffer buf ) = 0;

    /// Send any encrypted bytes still held by the session.
    virtual
    poll_result<>
    flush() = 0;

    /** Advance the close-notify exchange.

        Clean end of the transport is reported as
        @ref error::eof, or as `errc::broken_pipe` when the
        transport failed while our close-notify was sent.
    */
    virtual
    poll_result<shutdown_state>
    shutdown() = 0;

    /// Return the transport.
    virtual
    transport&
    next_layer() noexcept = 0;

    /// Return the negotiated ALPN protocol, or an empty string.
    virtual
    std::string_view
    alpn_protocol() const noexcept
    {
        return {};
    }

    /// Return the engine's native session handle.
    virtual
    void*
    native_handle() noexcept
    {
        return nullptr;
    }
};

/** A secure transport library.

    An engine turns a @ref context and a transport into a
    @ref session. Engines are stateless; their native
    configuration is cached inside each context.

    @see openssl_engine
    @see wolfssl_engine
*/
class BOOST_NBTLS_DECL engine
{
public:
    virtual ~engine() = default;

    /// Return the engine name.
    virtual
    char const*
    name() const noexcept = 0;

    /** Build the native configuration for a context.

        This performs no I/O. The result is cached in the
        context, so preparing the same context again returns
        the same result.

        @return @ref error::setup_failed if the engine rejects
            the configuration.
    */
    virtual
    system::error_code
    prepare( context const& ctx ) const = 0;

    /** Create a session.

        The session starts in the connect state for the client
        role and in the accept state for the server role. No
        I/O is performed.

        @param ctx The configuration.
        @param params The per-connection parameters.
        @param next The transport, which the session owns.
        @param ec Set to @ref error::setup_failed on failure.

        @return The session, or null on failure.
    */
    virtual
    std::unique_ptr<session>
    make_session(
        context const& ctx,
        session_params const& params,
        std::unique_ptr<transport> next,
        system::error_code& ec ) const = 0;
};

} // namespace boost::nbtls::tls

#endif
