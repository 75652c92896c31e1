#ifndef BYTE_ORDER_HPP
#define BYTE_ORDER_HPP

#include <cstdint>
#include <cstring>
#include <vector>

// Big-endian (network order) field helpers for frame encoding.

inline void append_bytes(std::vector<uint8_t> &data, const void *copy, size_t len)
{
    const auto prev_size = data.size();
    data.resize(prev_size + len);
    std::memcpy(&data[prev_size], copy, len);
}

inline void append_be32(std::vector<uint8_t> &data, uint32_t value)
{
    data.push_back(static_cast<uint8_t>(value >> 24));
    data.push_back(static_cast<uint8_t>(value >> 16));
    data.push_back(static_cast<uint8_t>(value >> 8));
    data.push_back(static_cast<uint8_t>(value));
}

inline void append_be64(std::vector<uint8_t> &data, uint64_t value)
{
    append_be32(data, static_cast<uint32_t>(value >> 32));
    append_be32(data, static_cast<uint32_t>(value));
}

inline uint32_t read_be32(const uint8_t *data)
{
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

inline uint64_t read_be64(const uint8_t *data)
{
    return (static_cast<uint64_t>(read_be32(data)) << 32) | read_be32(data + 4);
}

#endif
