//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/tls/context.hpp>
#include "src/tls/detail/context_impl.hpp"

#include <fstream>
#include <iterator>
#include <utility>

namespace boost::nbtls::tls {

namespace {

// Read a whole file. `out` is unchanged on failure.
system::error_code
load_file(
    std::string_view filename,
    std::string& out )
{
    std::ifstream file( std::string( filename ), std::ios::binary );
    if( !file )
        return make_error_code(
            system::errc::no_such_file_or_directory );
    out.assign(
        std::istreambuf_iterator<char>( file ),
        std::istreambuf_iterator<char>() );
    return {};
}

// Store encoded credentials together with their format
void
store(
    std::string& data,
    file_format& data_format,
    std::string value,
    file_format format )
{
    data = std::move( value );
    data_format = format;
}

system::error_code
store_file(
    std::string& data,
    file_format& data_format,
    std::string_view filename,
    file_format format )
{
    std::string value;
    if( auto ec = load_file( filename, value ) )
        return ec;
    store( data, data_format, std::move( value ), format );
    return {};
}

} // namespace

context::
context()
    : impl_( std::make_shared<impl>() )
{
}

//------------------------------------------------------------------------------

void
context::
use_certificate(
    std::string_view certificate,
    file_format format )
{
    store( impl_->entity_certificate, impl_->entity_cert_format,
        std::string( certificate ), format );
}

system::error_code
context::
use_certificate_file(
    std::string_view filename,
    file_format format )
{
    return store_file( impl_->entity_certificate,
        impl_->entity_cert_format, filename, format );
}

void
context::
use_certificate_chain( std::string_view chain )
{
    impl_->certificate_chain = std::string( chain );
}

system::error_code
context::
use_certificate_chain_file( std::string_view filename )
{
    return load_file( filename, impl_->certificate_chain );
}

void
context::
use_private_key(
    std::string_view private_key,
    file_format format )
{
    store( impl_->private_key, impl_->private_key_format,
        std::string( private_key ), format );
}

system::error_code
context::
use_private_key_file(
    std::string_view filename,
    file_format format )
{
    return store_file( impl_->private_key,
        impl_->private_key_format, filename, format );
}

//------------------------------------------------------------------------------

void
context::
add_certificate_authority( std::string_view ca )
{
    impl_->ca_certificates.emplace_back( ca );
}

system::error_code
context::
load_verify_file( std::string_view filename )
{
    std::string pem;
    if( auto ec = load_file( filename, pem ) )
        return ec;
    impl_->ca_certificates.push_back( std::move( pem ) );
    return {};
}

void
context::
add_verify_path( std::string_view path )
{
    impl_->verify_paths.emplace_back( path );
}

void
context::
set_default_verify_paths()
{
    impl_->use_default_verify_paths = true;
}

//------------------------------------------------------------------------------

void
context::
set_min_protocol_version( version v )
{
    impl_->min_version = v;
}

void
context::
set_max_protocol_version( version v )
{
    impl_->max_version = v;
}

void
context::
set_ciphersuites( std::string_view ciphers )
{
    impl_->ciphersuites = std::string( ciphers );
}

void
context::
set_alpn( std::initializer_list<std::string_view> protocols )
{
    impl_->alpn_protocols.assign( protocols.begin(), protocols.end() );
}

void
context::
set_verify_mode( verify_mode mode )
{
    impl_->verification_mode = mode;
}

void
context::
set_verify_depth( int depth )
{
    impl_->verify_depth = depth;
}

void
context::
set_servername_callback_impl(
    std::function<bool( std::string_view )> callback )
{
    impl_->servername_callback = std::move( callback );
}

} // namespace boost::nbtls::tls
