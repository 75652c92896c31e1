#ifndef STREAM_RECEIVER_HPP
#define STREAM_RECEIVER_HPP

#include <cstdint>
#include <vector>
#include "byte_stream.hpp"
#include "config.hpp"
#include "protocol/frame_codec.hpp"
#include "sink.hpp"

struct TransferStats
{
    uint64_t bytes_written = 0;
    uint64_t reads = 0;
    uint64_t chunks = 0;
};

/*
    Copies a payload from the connection into a sink through one fixed-size
    buffer. Nothing past the declared length is ever read.

    Single-length mode:
        u64: total length
        byte-array: data

    Chunked mode, repeated until remaining == length:
        (response frame with Status::GAME, except for the first chunk whose
         frame the dispatcher has already consumed)
        u64: remaining length, including this chunk
        u32: this chunk's length
        byte-array: chunk data
 */
class StreamReceiver
{
private:
    ByteStream &stream;
    FrameCodec &codec;
    Sink &sink;
    std::vector<uint8_t> buffer;

    void copy(uint64_t length, TransferStats &stats);

public:
    StreamReceiver(ByteStream &stream, FrameCodec &codec, Sink &sink, size_t buffer_size = IO_SIZE);

    TransferStats receive_fixed(uint64_t length);
    TransferStats receive_single_length();
    TransferStats receive_chunked();

    // Picks the shape from the codec's protocol revision.
    TransferStats receive_game();
};

#endif
