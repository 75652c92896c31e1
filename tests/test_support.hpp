#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include "byte_stream.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "dump/sink.hpp"
#include "protocol/byte_order.hpp"

// Plays back scripted console bytes and records everything the client sends.
class MemoryStream : public ByteStream
{
public:
    std::vector<uint8_t> input;
    size_t position = 0;
    std::vector<uint8_t> output;
    size_t read_calls = 0;
    bool closed = false;

    void read_exact(uint8_t *buffer, size_t len) override
    {
        if (closed)
            throw ConnectionError("read on closed stream");
        if (input.size() - position < len)
            throw ConnectionError("Connection closed by peer");
        std::memcpy(buffer, input.data() + position, len);
        position += len;
        read_calls++;
    }

    void write_all(const uint8_t *data, size_t len) override
    {
        if (closed)
            throw ConnectionError("write on closed stream");
        output.insert(output.end(), data, data + len);
    }

    void close() override
    {
        closed = true;
    }

    size_t unread() const
    {
        return input.size() - position;
    }
};

class VectorSink : public Sink
{
public:
    std::vector<uint8_t> &data;
    size_t writes = 0;
    size_t flushes = 0;

    explicit VectorSink(std::vector<uint8_t> &data) : data(data) {}

    void write(const uint8_t *bytes, size_t len) override
    {
        data.insert(data.end(), bytes, bytes + len);
        writes++;
    }

    void flush() override
    {
        flushes++;
    }
};

inline void append(std::vector<uint8_t> &to, const std::vector<uint8_t> &from)
{
    to.insert(to.end(), from.begin(), from.end());
}

inline std::vector<uint8_t> frame_header(uint32_t version)
{
    std::vector<uint8_t> bytes;
    append_bytes(bytes, MAGIC_NUMBER, MAGIC_SIZE);
    append_be32(bytes, version);
    return bytes;
}

inline std::vector<uint8_t> response_frame(uint32_t version, uint32_t status)
{
    auto bytes = frame_header(version);
    append_be32(bytes, status);
    return bytes;
}

inline std::vector<uint8_t> request_frame(uint32_t version, uint32_t command)
{
    return response_frame(version, command);
}

// Deterministic payload where byte i is (i * 31 + 7) mod 251
inline std::vector<uint8_t> pattern_bytes(size_t len)
{
    std::vector<uint8_t> bytes(len);
    for (size_t i = 0; i < len; ++i)
        bytes[i] = static_cast<uint8_t>((i * 31 + 7) % 251);
    return bytes;
}

inline std::vector<uint8_t> disc_info_payload(uint8_t disc_type, const std::string &game_name,
                                              const std::string &internal_name)
{
    std::vector<uint8_t> bytes(DISC_INFO_SIZE, 0);
    bytes[0] = disc_type;
    std::memcpy(bytes.data() + DISC_TYPE_SIZE, game_name.data(), game_name.size());
    std::memcpy(bytes.data() + DISC_TYPE_SIZE + GAME_NAME_SIZE, internal_name.data(), internal_name.size());
    return bytes;
}

#endif
