#ifndef NETDUMP_CLIENT_HPP
#define NETDUMP_CLIENT_HPP

#include <functional>
#include <memory>
#include <string>
#include "byte_stream.hpp"
#include "config.hpp"
#include "dump/disc_info.hpp"
#include "dump/sink.hpp"
#include "dump/stream_receiver.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/protocol_revision.hpp"

enum class Operation
{
    DISCONNECT,
    EXIT_PROGRAM,
    SHUTDOWN,
    EJECT_DISC,
    GET_DISC_INFO,
    DUMP_BCA,
    DUMP_GAME,
    FULL
};

enum class OperationResult
{
    SUCCESS,
    NO_DISC,
    COULD_NOT_EJECT,
    UNKNOWN_DISC_TYPE,
    PROTOCOL_ERROR,
    UNEXPECTED_RESPONSE,
    DECODE_FAILED,
    NOT_SUPPORTED
};

struct OutputOptions
{
    // Output file, or the output directory for Operation::FULL. For
    // GET_DISC_INFO an empty path prints a summary instead of writing JSON.
    std::string path;
    bool to_stdout = false;
    bool hash = false;
};

// Opens the payload destination once the console has accepted the command.
using SinkFactory = std::function<std::unique_ptr<Sink>()>;

const char *operation_name(Operation operation);
const char *operation_result_name(OperationResult result);
int exit_code_for(OperationResult result);

// Drives one operation over an already connected session.
class NetdumpClient
{
private:
    ByteStream &stream;
    FrameCodec codec;
    size_t io_size;

    bool check_supported(Command command) const;
    OperationResult report_failure(Command command, const ResponseHeader &header) const;
    OperationResult simple_command(Command command);
    OperationResult execute(Operation operation, const OutputOptions &options);
    OperationResult full_dump(const OutputOptions &options);
    OperationResult info_to_output(const std::string &path);

public:
    NetdumpClient(ByteStream &stream, const ProtocolRevision &revision, size_t io_size = IO_SIZE);

    // Runs the operation, then tears the session down and closes the stream.
    // Fatal protocol and I/O failures are thrown instead of returned.
    OperationResult run(Operation operation, const OutputOptions &options = OutputOptions());

    OperationResult eject_disc();
    OperationResult exit_program();
    OperationResult shutdown();
    OperationResult get_disc_info(DiscInfo &info);
    OperationResult dump_bca(const SinkFactory &open_sink);
    OperationResult dump_game(const SinkFactory &open_sink, bool hash = false, TransferStats *stats = nullptr);

    // Best effort: failures are logged as warnings. Returns true on OK.
    bool disconnect();
};

#endif
