#include "frame_codec.hpp"
#include <cstring>
#include <sstream>
#include "byte_order.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"

FrameCodec::FrameCodec(ByteStream &stream, const ProtocolRevision &revision)
    : stream(stream), revision(revision)
{
}

void FrameCodec::append_header(std::vector<uint8_t> &packet) const
{
    append_bytes(packet, MAGIC_NUMBER, MAGIC_SIZE);
    append_be32(packet, revision.version);
}

void FrameCodec::check_header(const uint8_t *header) const
{
    if (std::memcmp(header, MAGIC_NUMBER, MAGIC_SIZE) != 0)
    {
        throw FramingError("Bad magic number in frame from console");
    }

    uint32_t version = read_be32(header + MAGIC_SIZE);
    if (version != revision.version)
    {
        std::ostringstream message;
        message << "Protocol version mismatch: expected " << revision.version << ", got " << version;
        throw FramingError(message.str());
    }
}

std::vector<uint8_t> FrameCodec::encode_request(Command command) const
{
    std::vector<uint8_t> packet;
    packet.reserve(REQUEST_SIZE);
    append_header(packet);
    append_be32(packet, revision.command_code(command));
    return packet;
}

Command FrameCodec::decode_request(const uint8_t *data, size_t len) const
{
    if (len != REQUEST_SIZE)
    {
        throw FramingError("Request frame must be " + std::to_string(REQUEST_SIZE) + " bytes, got " +
                           std::to_string(len));
    }
    check_header(data);
    return revision.command_from_code(read_be32(data + FRAME_HEADER_SIZE));
}

void FrameCodec::send_frame(Command command)
{
    auto packet = encode_request(command);
    log_debug("-> ", command_name(command));
    stream.write_all(packet.data(), packet.size());
}

ResponseHeader FrameCodec::read_response_header()
{
    uint8_t header[FRAME_HEADER_SIZE];
    stream.read_exact(header, sizeof(header));
    check_header(header);

    ResponseHeader response;
    response.code = read_u32();
    response.status = revision.status_from_code(response.code);
    log_debug("<- ", status_name(response.status));
    return response;
}

uint64_t FrameCodec::read_u64()
{
    uint8_t field[8];
    stream.read_exact(field, sizeof(field));
    return read_be64(field);
}

uint32_t FrameCodec::read_u32()
{
    uint8_t field[4];
    stream.read_exact(field, sizeof(field));
    return read_be32(field);
}

const ProtocolRevision &FrameCodec::get_revision() const
{
    return revision;
}
