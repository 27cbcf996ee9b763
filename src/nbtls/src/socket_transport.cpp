//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#include <boost/nbtls/socket_transport.hpp>
#include <boost/nbtls/error.hpp>
#include <boost/nbtls/detail/except.hpp>
#include "src/detail/log.hpp"
#include "src/detail/make_err.hpp"

#include <string>

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace boost::nbtls {

namespace {

system::error_code
set_nonblocking(int fd) noexcept
{
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return detail::make_err(errno);
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return detail::make_err(errno);
    return {};
}

} // namespace

socket_transport::
~socket_transport()
{
    close();
}

socket_transport::
socket_transport(socket_transport&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
{
}

socket_transport&
socket_transport::
operator=(socket_transport&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

system::error_code
socket_transport::
assign(int fd)
{
    close();
    fd_ = fd;
    return set_nonblocking(fd_);
}

system::error_code
socket_transport::
connect(
    std::string_view host,
    std::string_view service)
{
    close();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* list = nullptr;
    int gai = ::getaddrinfo(
        std::string(host).c_str(),
        std::string(service).c_str(),
        &hints, &list);
    if (gai != 0)
    {
        detail::log().debug("getaddrinfo {}:{}: {}",
            host, service, ::gai_strerror(gai));
        return detail::make_gai_err(gai);
    }

    system::error_code ec = detail::make_err(EHOSTUNREACH);
    for (auto* ai = list; ai; ai = ai->ai_next)
    {
        int fd = ::socket(ai->ai_family,
            ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0)
        {
            ec = detail::make_err(errno);
            continue;
        }

        int result;
        do
        {
            result = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        }
        while (result < 0 && errno == EINTR);

        if (result < 0)
        {
            ec = detail::make_err(errno);
            ::close(fd);
            continue;
        }

        ec = assign(fd);
        break;
    }
    ::freeaddrinfo(list);

    if (ec)
    {
        detail::log().debug("connect {}:{}: {}",
            host, service, ec.message());
        close();
    }
    return ec;
}

system::error_code
socket_transport::
wait(
    want w,
    int timeout_ms) const
{
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = (w == want::read) ? POLLIN : POLLOUT;

    for (;;)
    {
        int n = ::poll(&pfd, 1, timeout_ms);
        if (n > 0)
            return {};
        if (n == 0)
            return make_error_code(system::errc::timed_out);
        if (errno != EINTR)
            return detail::make_err(errno);
    }
}

void
socket_transport::
close() noexcept
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

poll_result<std::size_t>
socket_transport::
read_some(mutable_buffer buf)
{
    if (fd_ < 0)
        return detail::make_err(EBADF);

    for (;;)
    {
        ssize_t n = ::recv(fd_, buf.data(), buf.size(), 0);
        if (n > 0)
            return static_cast<std::size_t>(n);
        if (n == 0)
            return make_error_code(error::eof);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return would_block{want::read};
        return detail::make_err(errno);
    }
}

poll_result<std::size_t>
socket_transport::
write_some(const_buffer buf)
{
    if (fd_ < 0)
        return detail::make_err(EBADF);

    for (;;)
    {
        ssize_t n = ::send(fd_, buf.data(), buf.size(), MSG_NOSIGNAL);
        if (n >= 0)
            return static_cast<std::size_t>(n);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return would_block{want::write};
        return detail::make_err(errno);
    }
}

//------------------------------------------------------------------------------

std::pair<socket_transport, socket_transport>
make_socket_pair()
{
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0)
        detail::throw_system_error(detail::make_err(errno), "socketpair");

    socket_transport a;
    socket_transport b;
    auto ec0 = a.assign(fds[0]);
    auto ec1 = b.assign(fds[1]);
    if (ec0)
        detail::throw_system_error(ec0, "make_socket_pair");
    if (ec1)
        detail::throw_system_error(ec1, "make_socket_pair");
    return { std::move(a), std::move(b) };
}

} // namespace boost::nbtls
