#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <cstring>
#include <cstdint>
#include <cerrno>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include "errors.hpp"

// Detect if an address string is IPv6
inline bool is_ipv6(const std::string &addr)
{
    struct in6_addr result;
    return inet_pton(AF_INET6, addr.c_str(), &result) == 1;
}

inline std::string errno_message(const std::string &what)
{
    return what + ": " + std::strerror(errno);
}

// RAII holder for a getaddrinfo() result list
class ResolvedAddress
{
private:
    addrinfo *list = nullptr;

public:
    ResolvedAddress(const std::string &host, uint16_t port)
    {
        addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        std::string service = std::to_string(port);
        int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &list);
        if (rc != 0)
        {
            throw ConnectionError("Failed to resolve " + host + ": " + gai_strerror(rc));
        }
    }

    ~ResolvedAddress()
    {
        if (list)
            freeaddrinfo(list);
    }

    ResolvedAddress(const ResolvedAddress &) = delete;
    ResolvedAddress &operator=(const ResolvedAddress &) = delete;

    const addrinfo *begin() const { return list; }
};

// Apply a send/receive timeout; zero leaves the socket fully blocking
inline void set_socket_timeout(int sockfd, int timeout_ms)
{
    if (timeout_ms <= 0)
        return;

    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(sockfd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
    {
        throw ConnectionError(errno_message("Failed to set socket timeout"));
    }
}

#endif
