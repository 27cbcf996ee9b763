//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls.hpp>
#include <boost/system/system_error.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace nbtls = boost::nbtls;
namespace tls = boost::nbtls::tls;

namespace {

// Milliseconds to wait for readiness before giving up
constexpr int timeout_ms = 10000;

// Wait for the readiness a suspended operation asked for
void
wait_for(
    nbtls::socket_transport const& sock,
    nbtls::want w)
{
    if (auto ec = sock.wait(w, timeout_ms))
        throw boost::system::system_error(ec, "wait");
}

tls::stream
do_handshake(
    tls::handshake hs,
    nbtls::socket_transport const& sock)
{
    for (;;)
    {
        auto r = hs.step();
        if (r.suspended())
        {
            wait_for(sock, r.interest());
            continue;
        }
        if (r.failed())
            throw boost::system::system_error(r.error(), "handshake");
        return std::move(r).value();
    }
}

void
write_all(
    tls::stream& s,
    nbtls::socket_transport const& sock,
    std::string_view data)
{
    while (!data.empty())
    {
        auto r = s.write_some(nbtls::buffer(data));
        if (r.suspended())
        {
            wait_for(sock, r.interest());
            continue;
        }
        data.remove_prefix(r.value());
    }
}

void
do_request(
    tls::stream& s,
    nbtls::socket_transport const& sock,
    std::string_view host)
{
    std::string request =
        "GET / HTTP/1.1\r\n"
        "Host: " + std::string(host) + "\r\n"
        "Connection: close\r\n"
        "\r\n";
    write_all(s, sock, request);

    // Read the entire response until the server closes
    std::string response;
    char buf[4096];
    for (;;)
    {
        auto r = s.read_some(nbtls::buffer(buf, sizeof(buf)));
        if (r.suspended())
        {
            wait_for(sock, r.interest());
            continue;
        }
        if (r.failed())
        {
            // Many servers close without close-notify
            if (r.error() != nbtls::error::eof &&
                r.error() != nbtls::error::stream_truncated)
                throw boost::system::system_error(r.error(), "read");
            break;
        }
        response.append(buf, *r);
    }
    std::cout << response << std::endl;

    for (;;)
    {
        auto r = s.shutdown();
        if (!r.suspended())
            break;
        wait_for(sock, r.interest());
    }
}

} // namespace

int
main(int argc, char* argv[])
{
    if (argc < 2 || argc > 3)
    {
        std::cerr <<
            "Usage: https_client <hostname> [port]\n"
            "Example:\n"
            "    https_client www.boost.org 443\n";
        return EXIT_FAILURE;
    }

    std::string hostname = argv[1];
    std::string port = (argc == 3) ? argv[2] : "443";

    try
    {
        auto sock = std::make_unique<nbtls::socket_transport>();
        if (auto ec = sock->connect(hostname, port))
            throw boost::system::system_error(ec, "connect");

        // The handshake takes ownership; keep a reference for waiting
        nbtls::socket_transport const& ref = *sock;

        tls::context ctx;
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(tls::verify_mode::peer);
        ctx.set_alpn({"http/1.1"});

        tls::connector c(ctx, tls::openssl_engine());
        auto s = do_handshake(
            tls::connect(c, hostname, std::move(sock)), ref);
        do_request(s, ref, hostname);
    }
    catch(boost::system::system_error const& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    catch(std::exception const& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
