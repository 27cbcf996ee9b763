//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_TLS_ACCEPTOR_HPP
#define BOOST_NBTLS_TLS_ACCEPTOR_HPP

#include <boost/nbtls/detail/config.hpp>
#include <boost/nbtls/transport.hpp>
#include <boost/nbtls/tls/context.hpp>
#include <boost/nbtls/tls/engine.hpp>
#include <boost/nbtls/tls/handshake.hpp>
#include <boost/system/error_code.hpp>

#include <memory>

namespace boost::nbtls::tls {

/** Server-side factory for handshakes.

    The engine prepares the context when the acceptor is
    constructed, so configuration errors such as a private key
    which does not match its certificate are reported before
    any connection is accepted.
*/
class BOOST_NBTLS_DECL acceptor
{
    context ctx_;
    engine const* eng_;

public:
    /** Construct an acceptor.

        @param ctx The configuration, which normally holds the
            server certificate and private key.
        @param eng The engine. Must outlive the acceptor and
            every handshake created from it.

        @throws system::system_error with
            @ref error::setup_failed if the engine rejects the
            context.
    */
    acceptor(
        context ctx,
        engine const& eng );

    /** Construct an acceptor.

        @param ctx The configuration.
        @param eng The engine.
        @param ec Set to @ref error::setup_failed if the engine
            rejects the context.
    */
    acceptor(
        context ctx,
        engine const& eng,
        system::error_code& ec );

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

/** Begin a server handshake.

    No I/O is performed; the first @ref handshake::step starts
    the handshake.

    @param a The acceptor.
    @param next The transport, already connected to the peer.
*/
BOOST_NBTLS_DECL
handshake
accept(
    acceptor const& a,
    std::unique_ptr<transport> next );

} // namespace boost::nbtls::tls

#endif
