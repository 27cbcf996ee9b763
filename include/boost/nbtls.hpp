//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_HPP
#define BOOST_NBTLS_HPP

#include <boost/nbtls/buffers.hpp>
#include <boost/nbtls/error.hpp>
#include <boost/nbtls/poll_result.hpp>
#include <boost/nbtls/socket_transport.hpp>
#include <boost/nbtls/transport.hpp>

#include <boost/nbtls/tls/acceptor.hpp>
#include <boost/nbtls/tls/connector.hpp>
#include <boost/nbtls/tls/context.hpp>
#include <boost/nbtls/tls/engine.hpp>
#include <boost/nbtls/tls/handshake.hpp>
#include <boost/nbtls/tls/openssl.hpp>
#include <boost/nbtls/tls/stream.hpp>
#include <boost/nbtls/tls/wolfssl.hpp>

#endif
