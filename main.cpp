#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "config.hpp"
#include "connection.hpp"
#include "log.hpp"
#include "client/netdump_client.hpp"
#include "protocol/protocol_revision.hpp"

struct Config
{
    std::string host_address;
    uint16_t port = DEFAULT_PORT;
    uint32_t protocol_version = DEFAULT_PROTOCOL_VERSION;
    int timeout_ms = 0;
    bool verbose = false;
    Operation operation = Operation::DISCONNECT;
    OutputOptions output;
};

int main(int argc, char *argv[])
{
    CLI::App app{"netdump - Client for netdump running on a Wii"};

    app.set_version_flag("-v,--version", PROGRAM_VERSION);

    Config config;

    app.add_option("-a,--address", config.host_address, "Hostname of the Wii to connect to")
        ->required();

    app.add_option("-p,--port", config.port, "Port netdump listens on")
        ->capture_default_str();

    std::vector<uint32_t> known_versions;
    for (const auto &revision : protocol_revisions())
        known_versions.push_back(revision.version);

    app.add_option("-P,--protocol-version", config.protocol_version, "Protocol revision spoken by the Wii")
        ->capture_default_str()
        ->check(CLI::IsMember(known_versions));

    app.add_option("-t,--timeout", config.timeout_ms, "Socket timeout in milliseconds, 0 blocks forever")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);

    app.add_flag("--verbose", config.verbose, "Log protocol traffic");

    auto full = app.add_subcommand("full", "Dumps the Game, BCA and Info to three separate files");
    full->add_option("-o,--output", config.output.path, "Where the files will be written to")
        ->default_str(".");
    full->add_flag("--hash", config.output.hash, "Print MD5 and SHA-1 of the game dump");

    auto game = app.add_subcommand("game", "Dumps game ISO only");
    game->add_option("-o,--output", config.output.path, "Where to write game dump")
        ->default_str(std::string("./") + DEFAULT_GAME_FILE);
    game->add_flag("-s,--stdout", config.output.to_stdout,
                   "Output to stdout rather than to a file. If this is set, 'output' option will be ignored");
    game->add_flag("--hash", config.output.hash, "Print MD5 and SHA-1 of the game dump");

    auto bca = app.add_subcommand("bca", "Dumps game BCA only");
    bca->add_option("-o,--output", config.output.path, "Where to write BCA dump")
        ->default_str(std::string("./") + DEFAULT_BCA_FILE);
    bca->add_flag("-s,--stdout", config.output.to_stdout,
                  "Output to stdout rather than to a file. If this is set, 'output' option will be ignored");

    auto info = app.add_subcommand("info", "Returns Disc type (GC, Wii Single-sided or Wii Double-sided), Game ID and Game Name");
    info->add_option("-o,--output", config.output.path, "Write info dump as JSON to a file");

    auto eject = app.add_subcommand("eject", "Eject the Disc from the Drive");
    auto exit_program = app.add_subcommand("exit", "Exits the program on the Wii");
    auto shutdown = app.add_subcommand("shutdown", "Shutdown the Wii");
    auto disconnect = app.add_subcommand("disconnect", "Only open and close a session");

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    if (full->parsed())
        config.operation = Operation::FULL;
    else if (game->parsed())
        config.operation = Operation::DUMP_GAME;
    else if (bca->parsed())
        config.operation = Operation::DUMP_BCA;
    else if (info->parsed())
        config.operation = Operation::GET_DISC_INFO;
    else if (eject->parsed())
        config.operation = Operation::EJECT_DISC;
    else if (exit_program->parsed())
        config.operation = Operation::EXIT_PROGRAM;
    else if (shutdown->parsed())
        config.operation = Operation::SHUTDOWN;
    else if (disconnect->parsed())
        config.operation = Operation::DISCONNECT;

    if (config.verbose)
        set_log_level(LogLevel::VERBOSE);

    try
    {
        const ProtocolRevision &revision = protocol_revision(config.protocol_version);
        Connection connection(config.host_address, config.port, config.timeout_ms);
        log_debug("Connected to ", connection.get_peer(), " using protocol revision ", revision.version, " (",
                  revision.name, ")");

        NetdumpClient client(connection, revision);
        OperationResult result = client.run(config.operation, config.output);
        if (result != OperationResult::SUCCESS)
        {
            log_debug(operation_name(config.operation), " failed: ", operation_result_name(result));
        }
        return exit_code_for(result);
    }
    catch (const std::exception &e)
    {
        log_error(e.what());
        return 1;
    }
}
