#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include <cstdint>
#include <vector>
#include "byte_stream.hpp"
#include "protocol_revision.hpp"

struct ResponseHeader
{
    Status status;
    uint32_t code;
};

/*
    Request:  [magic: 7 bytes "NETDUMP"][version: u32 BE][command: u32 BE]
    Response: [magic: 7 bytes][version: u32 BE][status: u32 BE][payload]

    A magic or version mismatch throws FramingError; the session cannot be
    resynchronized after it.
 */
class FrameCodec
{
private:
    ByteStream &stream;
    const ProtocolRevision &revision;

    void append_header(std::vector<uint8_t> &packet) const;
    void check_header(const uint8_t *header) const;

public:
    FrameCodec(ByteStream &stream, const ProtocolRevision &revision);

    std::vector<uint8_t> encode_request(Command command) const;
    Command decode_request(const uint8_t *data, size_t len) const;

    void send_frame(Command command);
    ResponseHeader read_response_header();

    uint64_t read_u64();
    uint32_t read_u32();

    const ProtocolRevision &get_revision() const;
};

#endif
