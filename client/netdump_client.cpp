#include "netdump_client.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include "errors.hpp"
#include "log.hpp"

namespace
{
Status expected_status(Command command)
{
    switch (command)
    {
    case Command::GET_DISC_INFO:
        return Status::DISC_INFO;
    case Command::DUMP_BCA:
        return Status::BCA;
    case Command::DUMP_GAME:
        return Status::GAME;
    default:
        return Status::OK;
    }
}

bool reads_disc(Command command)
{
    return command == Command::GET_DISC_INFO || command == Command::DUMP_BCA || command == Command::DUMP_GAME;
}

// Exit and shutdown end the remote session themselves
bool terminates_session(Operation operation)
{
    return operation == Operation::EXIT_PROGRAM || operation == Operation::SHUTDOWN;
}
} // namespace

const char *operation_name(Operation operation)
{
    switch (operation)
    {
    case Operation::DISCONNECT:
        return "disconnect";
    case Operation::EXIT_PROGRAM:
        return "exit";
    case Operation::SHUTDOWN:
        return "shutdown";
    case Operation::EJECT_DISC:
        return "eject";
    case Operation::GET_DISC_INFO:
        return "info";
    case Operation::DUMP_BCA:
        return "bca";
    case Operation::DUMP_GAME:
        return "game";
    case Operation::FULL:
        return "full";
    }
    return "unknown";
}

const char *operation_result_name(OperationResult result)
{
    switch (result)
    {
    case OperationResult::SUCCESS:
        return "success";
    case OperationResult::NO_DISC:
        return "no disc present";
    case OperationResult::COULD_NOT_EJECT:
        return "could not eject";
    case OperationResult::UNKNOWN_DISC_TYPE:
        return "unknown disc type";
    case OperationResult::PROTOCOL_ERROR:
        return "protocol error";
    case OperationResult::UNEXPECTED_RESPONSE:
        return "unexpected response";
    case OperationResult::DECODE_FAILED:
        return "malformed payload";
    case OperationResult::NOT_SUPPORTED:
        return "not supported";
    }
    return "unknown";
}

int exit_code_for(OperationResult result)
{
    switch (result)
    {
    case OperationResult::SUCCESS:
        return 0;
    case OperationResult::NO_DISC:
    case OperationResult::COULD_NOT_EJECT:
    case OperationResult::UNKNOWN_DISC_TYPE:
        return 2;
    case OperationResult::PROTOCOL_ERROR:
    case OperationResult::UNEXPECTED_RESPONSE:
    case OperationResult::DECODE_FAILED:
        return 3;
    case OperationResult::NOT_SUPPORTED:
        return 4;
    }
    return 1;
}

NetdumpClient::NetdumpClient(ByteStream &stream, const ProtocolRevision &revision, size_t io_size)
    : stream(stream), codec(stream, revision), io_size(io_size)
{
}

bool NetdumpClient::check_supported(Command command) const
{
    if (codec.get_revision().supports(command))
        return true;

    log_error("Operation not supported by protocol revision ", codec.get_revision().version, " (",
              command_name(command), ")");
    return false;
}

OperationResult NetdumpClient::report_failure(Command command, const ResponseHeader &header) const
{
    switch (header.status)
    {
    case Status::NO_DISC:
        log_error("No Disc in Drive, can't proceed");
        return OperationResult::NO_DISC;
    case Status::PROTOCOL_ERROR:
        log_error("Unknown Protocol-related error, can't proceed");
        return OperationResult::PROTOCOL_ERROR;
    case Status::COULD_NOT_EJECT:
        if (command == Command::EJECT_DISC)
        {
            log_error("Couldn't Eject Disc");
            return OperationResult::COULD_NOT_EJECT;
        }
        break;
    case Status::UNKNOWN_DISC_TYPE:
        if (reads_disc(command))
        {
            log_error("Unknown Disc Type, can't proceed");
            return OperationResult::UNKNOWN_DISC_TYPE;
        }
        break;
    default:
        break;
    }

    // Any payload that might follow is left unread
    std::ostringstream message;
    message << "Weird response from Wii to " << command_name(command) << " (status 0x" << std::hex << header.code
            << ")";
    log_error(message.str());
    return OperationResult::UNEXPECTED_RESPONSE;
}

OperationResult NetdumpClient::simple_command(Command command)
{
    if (!check_supported(command))
        return OperationResult::NOT_SUPPORTED;

    codec.send_frame(command);
    ResponseHeader header = codec.read_response_header();
    if (header.status != Status::OK)
        return report_failure(command, header);
    return OperationResult::SUCCESS;
}

OperationResult NetdumpClient::eject_disc()
{
    return simple_command(Command::EJECT_DISC);
}

OperationResult NetdumpClient::exit_program()
{
    return simple_command(Command::EXIT_PROGRAM);
}

OperationResult NetdumpClient::shutdown()
{
    return simple_command(Command::SHUTDOWN);
}

OperationResult NetdumpClient::get_disc_info(DiscInfo &info)
{
    codec.send_frame(Command::GET_DISC_INFO);
    ResponseHeader header = codec.read_response_header();
    if (header.status != expected_status(Command::GET_DISC_INFO))
        return report_failure(Command::GET_DISC_INFO, header);

    try
    {
        info = read_disc_info(stream);
    }
    catch (const DecodeError &e)
    {
        log_error("Malformed disc info: ", e.what());
        return OperationResult::DECODE_FAILED;
    }
    return OperationResult::SUCCESS;
}

OperationResult NetdumpClient::dump_bca(const SinkFactory &open_sink)
{
    codec.send_frame(Command::DUMP_BCA);
    ResponseHeader header = codec.read_response_header();
    if (header.status != expected_status(Command::DUMP_BCA))
        return report_failure(Command::DUMP_BCA, header);

    auto sink = open_sink();
    StreamReceiver receiver(stream, codec, *sink, io_size);
    receiver.receive_fixed(BCA_SIZE);
    return OperationResult::SUCCESS;
}

OperationResult NetdumpClient::dump_game(const SinkFactory &open_sink, bool hash, TransferStats *stats)
{
    codec.send_frame(Command::DUMP_GAME);
    ResponseHeader header = codec.read_response_header();
    if (header.status != expected_status(Command::DUMP_GAME))
        return report_failure(Command::DUMP_GAME, header);

    auto sink = open_sink();
    TransferStats transferred;

    if (hash)
    {
        DigestSink digest_sink(*sink, {DigestAlgorithm::MD5, DigestAlgorithm::SHA1});
        StreamReceiver receiver(stream, codec, digest_sink, io_size);
        transferred = receiver.receive_game();
        for (const auto &digest : digest_sink.finish())
        {
            log_info(digest.first, ": ", digest.second);
        }
    }
    else
    {
        StreamReceiver receiver(stream, codec, *sink, io_size);
        transferred = receiver.receive_game();
    }

    log_debug("Received ", transferred.bytes_written, " bytes in ", transferred.reads, " reads, ",
              transferred.chunks, " chunks");
    if (stats)
        *stats = transferred;
    return OperationResult::SUCCESS;
}

OperationResult NetdumpClient::info_to_output(const std::string &path)
{
    DiscInfo info;
    OperationResult result = get_disc_info(info);
    if (result != OperationResult::SUCCESS)
        return result;

    if (path.empty())
        print_disc_info(std::cout, info);
    else
        write_disc_info_json(path, info);
    return result;
}

OperationResult NetdumpClient::full_dump(const OutputOptions &options)
{
    namespace fs = std::filesystem;
    fs::path directory = options.path.empty() ? fs::path(".") : fs::path(options.path);

    OperationResult result = info_to_output((directory / DEFAULT_INFO_FILE).string());
    if (result != OperationResult::SUCCESS)
        return result;

    std::string bca_path = (directory / DEFAULT_BCA_FILE).string();
    result = dump_bca([&bca_path]() { return std::make_unique<FileSink>(bca_path); });
    if (result != OperationResult::SUCCESS)
        return result;

    std::string game_path = (directory / DEFAULT_GAME_FILE).string();
    return dump_game([&game_path]() { return std::make_unique<FileSink>(game_path); }, options.hash);
}

OperationResult NetdumpClient::execute(Operation operation, const OutputOptions &options)
{
    switch (operation)
    {
    case Operation::EXIT_PROGRAM:
        return exit_program();
    case Operation::SHUTDOWN:
        return shutdown();
    case Operation::EJECT_DISC:
        return eject_disc();
    case Operation::GET_DISC_INFO:
        return info_to_output(options.path);
    case Operation::DUMP_BCA:
    {
        std::string path = options.path.empty() ? DEFAULT_BCA_FILE : options.path;
        return dump_bca([&]() { return make_sink(options.to_stdout, path); });
    }
    case Operation::DUMP_GAME:
    {
        std::string path = options.path.empty() ? DEFAULT_GAME_FILE : options.path;
        return dump_game([&]() { return make_sink(options.to_stdout, path); }, options.hash);
    }
    case Operation::FULL:
        return full_dump(options);
    case Operation::DISCONNECT:
        break;
    }
    throw std::logic_error(std::string("No handler for operation ") + operation_name(operation));
}

OperationResult NetdumpClient::run(Operation operation, const OutputOptions &options)
{
    OperationResult result;

    if (operation == Operation::DISCONNECT)
    {
        result = disconnect() ? OperationResult::SUCCESS : OperationResult::UNEXPECTED_RESPONSE;
    }
    else
    {
        result = execute(operation, options);

        // A command the revision lacks was never sent, so the session is still open
        if (!terminates_session(operation) || result == OperationResult::NOT_SUPPORTED)
            disconnect();
    }

    stream.close();
    return result;
}

bool NetdumpClient::disconnect()
{
    try
    {
        codec.send_frame(Command::DISCONNECT);
        ResponseHeader header = codec.read_response_header();
        if (header.status == Status::OK)
            return true;
        log_warning("Weird response from Wii, disconnecting anyways");
    }
    catch (const NetdumpError &e)
    {
        log_warning("Disconnect failed: ", e.what());
    }
    return false;
}
