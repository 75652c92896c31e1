#include "stream_receiver.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include "errors.hpp"
#include "log.hpp"

StreamReceiver::StreamReceiver(ByteStream &stream, FrameCodec &codec, Sink &sink, size_t buffer_size)
    : stream(stream), codec(codec), sink(sink), buffer(buffer_size)
{
    if (buffer_size == 0)
    {
        throw std::invalid_argument("StreamReceiver buffer size must be positive");
    }
}

void StreamReceiver::copy(uint64_t length, TransferStats &stats)
{
    uint64_t received = 0;
    while (received < length)
    {
        // Last block is cut to the exact remaining count
        size_t block = static_cast<size_t>(std::min<uint64_t>(buffer.size(), length - received));
        stream.read_exact(buffer.data(), block);
        stats.reads++;
        sink.write(buffer.data(), block);
        received += block;
        stats.bytes_written += block;
    }
}

TransferStats StreamReceiver::receive_fixed(uint64_t length)
{
    TransferStats stats;
    copy(length, stats);
    sink.flush();
    return stats;
}

TransferStats StreamReceiver::receive_single_length()
{
    TransferStats stats;
    uint64_t total = codec.read_u64();
    log_debug("Receiving ", total, " bytes");
    copy(total, stats);
    sink.flush();
    return stats;
}

TransferStats StreamReceiver::receive_chunked()
{
    TransferStats stats;
    uint64_t expected_remaining = 0;

    for (;;)
    {
        if (stats.chunks > 0)
        {
            ResponseHeader header = codec.read_response_header();
            if (header.status != Status::GAME)
            {
                sink.flush();
                throw FramingError(std::string("Unexpected ") + status_name(header.status) +
                                   " frame in the middle of a game transfer");
            }
        }

        uint64_t remaining = codec.read_u64();
        uint32_t length = codec.read_u32();

        if (stats.chunks > 0 && remaining != expected_remaining)
        {
            sink.flush();
            throw FramingError("Chunk announces " + std::to_string(remaining) + " remaining bytes, expected " +
                               std::to_string(expected_remaining));
        }
        if (length > remaining)
        {
            sink.flush();
            throw FramingError("Chunk length " + std::to_string(length) + " exceeds remaining length " +
                               std::to_string(remaining));
        }

        copy(length, stats);
        stats.chunks++;

        if (remaining == length)
            break;
        expected_remaining = remaining - length;
    }

    sink.flush();
    return stats;
}

TransferStats StreamReceiver::receive_game()
{
    switch (codec.get_revision().game_transfer)
    {
    case GameTransfer::SINGLE_LENGTH:
        return receive_single_length();
    case GameTransfer::CHUNKED:
        return receive_chunked();
    }
    throw std::logic_error("Unknown game transfer shape");
}
