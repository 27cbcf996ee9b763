//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef SRC_TLS_DETAIL_CONTEXT_IMPL_HPP
#define SRC_TLS_DETAIL_CONTEXT_IMPL_HPP

#include <boost/nbtls/tls/context.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace boost::nbtls::tls {

namespace detail {

/** Abstract base for cached native engine contexts.

    Each engine derives from this to hold its native context
    handle (SSL_CTX*, WOLFSSL_CTX*) together with any error
    found while building it.
*/
class native_context_base
{
public:
    virtual ~native_context_base() = default;
};

struct context_data
{
    //--------------------------------------------
    // Credentials

    std::string entity_certificate;
    file_format entity_cert_format = file_format::pem;
    std::string certificate_chain;
    std::string private_key;
    file_format private_key_format = file_format::pem;

    //--------------------------------------------
    // Trust anchors

    std::vector<std::string> ca_certificates;
    std::vector<std::string> verify_paths;
    bool use_default_verify_paths = false;

    //--------------------------------------------
    // Protocol settings

    version min_version = version::tls_1_2;
    version max_version = version::tls_1_3;
    std::string ciphersuites;
    std::vector<std::string> alpn_protocols;

    //--------------------------------------------
    // Verification

    verify_mode verification_mode = verify_mode::none;
    int verify_depth = 100;

    //--------------------------------------------
    // SNI (Server Name Indication)

    std::function<bool( std::string_view )> servername_callback;

    //--------------------------------------------
    // Cached native contexts, one per engine

    struct entry
    {
        void const* key;
        std::unique_ptr<native_context_base> native;
    };

    mutable std::mutex native_contexts_mutex_;
    mutable std::vector<entry> native_contexts_;

    /** Find or insert a cached native context.

        @param key The unique key for the engine.
        @param create Factory returning a new native context.

        @return Pointer to the cached native context.
    */
    template<typename Factory>
    native_context_base*
    find( void const* key, Factory&& create ) const
    {
        std::lock_guard<std::mutex> lock( native_contexts_mutex_ );

        for( auto& e : native_contexts_ )
            if( e.key == key )
                return e.native.get();

        native_contexts_.push_back( entry{ key, create() } );
        return native_contexts_.back().native.get();
    }
};

} // namespace detail

//------------------------------------------------------------------------------

struct context::impl : detail::context_data
{
};

//------------------------------------------------------------------------------

namespace detail {

/** Return the portable configuration stored in a context.

    @param ctx The TLS context.
*/
inline context_data const&
get_context_data( context const& ctx ) noexcept
{
    return *ctx.impl_;
}

} // namespace detail

} // namespace boost::nbtls::tls

#endif
