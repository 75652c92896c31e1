#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <string>
#include <cstdint>
#include "byte_stream.hpp"

// Blocking TCP session with the console. One per command invocation.
class Connection : public ByteStream
{
private:
    int sockfd = -1;
    std::string remote_host;
    uint16_t remote_port;

public:
    Connection(const std::string &host, uint16_t port, int timeout_ms = 0);
    ~Connection() override;

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    void read_exact(uint8_t *buffer, size_t len) override;
    void write_all(const uint8_t *data, size_t len) override;
    void close() override;

    bool is_open() const;
    int get_fd() const;
    std::string get_peer() const;
};

#endif
