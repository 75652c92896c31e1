#include "connection.hpp"
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include "errors.hpp"
#include "network_utils.hpp"

Connection::Connection(const std::string &host, uint16_t port, int timeout_ms)
    : remote_host(host), remote_port(port)
{
    ResolvedAddress resolved(host, port);
    std::string last_error = "no usable address";

    for (const addrinfo *ai = resolved.begin(); ai != nullptr; ai = ai->ai_next)
    {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0)
        {
            last_error = errno_message("socket() failed");
            continue;
        }

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) < 0)
        {
            last_error = errno_message("connect() failed");
            ::close(fd);
            continue;
        }

        sockfd = fd;
        break;
    }

    if (sockfd < 0)
    {
        throw ConnectionError("Failed to connect to " + get_peer() + ": " + last_error);
    }

    int flag = 1;
    setsockopt(sockfd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

    try
    {
        set_socket_timeout(sockfd, timeout_ms);
    }
    catch (const ConnectionError &)
    {
        close();
        throw;
    }
}

Connection::~Connection()
{
    close();
}

void Connection::read_exact(uint8_t *buffer, size_t len)
{
    size_t received = 0;
    while (received < len)
    {
        ssize_t n = recv(sockfd, buffer + received, len - received, 0);
        if (n == 0)
        {
            throw ConnectionError("Connection closed by " + get_peer());
        }
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                throw ConnectionError("Timed out waiting for " + get_peer());
            throw ConnectionError(errno_message("recv() failed"));
        }
        received += static_cast<size_t>(n);
    }
}

void Connection::write_all(const uint8_t *data, size_t len)
{
    size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = send(sockfd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw ConnectionError(errno_message("send() failed"));
        }
        sent += static_cast<size_t>(n);
    }
}

void Connection::close()
{
    if (sockfd >= 0)
    {
        ::close(sockfd);
        sockfd = -1;
    }
}

bool Connection::is_open() const
{
    return sockfd >= 0;
}

int Connection::get_fd() const
{
    return sockfd;
}

std::string Connection::get_peer() const
{
    if (is_ipv6(remote_host))
        return "[" + remote_host + "]:" + std::to_string(remote_port);
    return remote_host + ":" + std::to_string(remote_port);
}
