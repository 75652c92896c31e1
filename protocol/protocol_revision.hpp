#ifndef PROTOCOL_REVISION_HPP
#define PROTOCOL_REVISION_HPP

#include <cstdint>
#include <string>
#include <vector>

enum class Command
{
    DISCONNECT,
    EXIT_PROGRAM,
    SHUTDOWN,
    EJECT_DISC,
    GET_DISC_INFO,
    DUMP_BCA,
    DUMP_GAME,
    UNKNOWN
};

enum class Status
{
    PROTOCOL_ERROR,
    NO_DISC,
    COULD_NOT_EJECT,
    UNKNOWN_DISC_TYPE,
    OK,
    DISC_INFO,
    BCA,
    GAME,
    UNEXPECTED
};

// How the console streams a game image after Status::GAME
enum class GameTransfer
{
    SINGLE_LENGTH,
    CHUNKED
};

struct CommandCode
{
    Command command;
    uint32_t code;
};

struct StatusCode
{
    Status status;
    uint32_t code;
};

// Wire codes and payload shapes of one protocol version. Revisions are not
// wire-compatible with each other.
struct ProtocolRevision
{
    uint32_t version;
    const char *name;
    GameTransfer game_transfer;
    std::vector<CommandCode> commands;
    std::vector<StatusCode> statuses;

    bool supports(Command command) const;
    uint32_t command_code(Command command) const;
    Command command_from_code(uint32_t code) const;
    Status status_from_code(uint32_t code) const;
};

const std::vector<ProtocolRevision> &protocol_revisions();
const ProtocolRevision &protocol_revision(uint32_t version);
bool is_known_protocol_version(uint32_t version);

const char *command_name(Command command);
const char *status_name(Status status);

#endif
