#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

#include <cstddef>
#include <cstdint>

// Blocking, ordered byte transport. Reads never return short: either the
// whole buffer is filled or an exception is thrown.
class ByteStream
{
public:
    virtual ~ByteStream() = default;
    virtual void read_exact(uint8_t *buffer, size_t len) = 0;
    virtual void write_all(const uint8_t *data, size_t len) = 0;
    virtual void close() = 0;
};

#endif
