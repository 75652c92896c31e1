#include "protocol_revision.hpp"
#include <stdexcept>

namespace
{
std::vector<ProtocolRevision> build_revisions()
{
    std::vector<ProtocolRevision> revisions;

    revisions.push_back(ProtocolRevision{
        0,
        "chunked",
        GameTransfer::CHUNKED,
        {
            {Command::DISCONNECT, 0xFFFFFFFF},
            {Command::SHUTDOWN, 0xFFFFFFFE},
            {Command::EJECT_DISC, 1},
            {Command::GET_DISC_INFO, 2},
            {Command::DUMP_BCA, 3},
            {Command::DUMP_GAME, 4},
        },
        {
            {Status::PROTOCOL_ERROR, 0xFFFFFFFF},
            {Status::NO_DISC, 0xFFFFFFFE},
            {Status::OK, 0},
            {Status::DISC_INFO, 1},
            {Status::BCA, 2},
            {Status::GAME, 3},
        },
    });

    revisions.push_back(ProtocolRevision{
        1,
        "single-length",
        GameTransfer::SINGLE_LENGTH,
        {
            {Command::DISCONNECT, 0xFFFFFFFF},
            {Command::EXIT_PROGRAM, 0xFFFFFFFE},
            {Command::SHUTDOWN, 0xFFFFFFFD},
            {Command::EJECT_DISC, 1},
            {Command::GET_DISC_INFO, 2},
            {Command::DUMP_BCA, 3},
            {Command::DUMP_GAME, 4},
        },
        {
            {Status::PROTOCOL_ERROR, 0xFFFFFFFF},
            {Status::NO_DISC, 0xFFFFFFFE},
            {Status::COULD_NOT_EJECT, 0xFFFFFFFD},
            {Status::UNKNOWN_DISC_TYPE, 0xFFFFFFFC},
            {Status::OK, 0},
            {Status::DISC_INFO, 1},
            {Status::BCA, 2},
            {Status::GAME, 3},
        },
    });

    return revisions;
}
} // namespace

bool ProtocolRevision::supports(Command command) const
{
    for (const auto &entry : commands)
    {
        if (entry.command == command)
            return true;
    }
    return false;
}

uint32_t ProtocolRevision::command_code(Command command) const
{
    for (const auto &entry : commands)
    {
        if (entry.command == command)
            return entry.code;
    }
    throw std::invalid_argument(std::string("Command ") + command_name(command) +
                                " is not part of protocol revision " + std::to_string(version));
}

Command ProtocolRevision::command_from_code(uint32_t code) const
{
    for (const auto &entry : commands)
    {
        if (entry.code == code)
            return entry.command;
    }
    return Command::UNKNOWN;
}

Status ProtocolRevision::status_from_code(uint32_t code) const
{
    for (const auto &entry : statuses)
    {
        if (entry.code == code)
            return entry.status;
    }
    return Status::UNEXPECTED;
}

const std::vector<ProtocolRevision> &protocol_revisions()
{
    static const std::vector<ProtocolRevision> revisions = build_revisions();
    return revisions;
}

const ProtocolRevision &protocol_revision(uint32_t version)
{
    for (const auto &revision : protocol_revisions())
    {
        if (revision.version == version)
            return revision;
    }
    throw std::invalid_argument("Unknown protocol version " + std::to_string(version));
}

bool is_known_protocol_version(uint32_t version)
{
    for (const auto &revision : protocol_revisions())
    {
        if (revision.version == version)
            return true;
    }
    return false;
}

const char *command_name(Command command)
{
    switch (command)
    {
    case Command::DISCONNECT:
        return "Disconnect";
    case Command::EXIT_PROGRAM:
        return "ExitProgram";
    case Command::SHUTDOWN:
        return "Shutdown";
    case Command::EJECT_DISC:
        return "EjectDisc";
    case Command::GET_DISC_INFO:
        return "GetDiscInfo";
    case Command::DUMP_BCA:
        return "DumpBCA";
    case Command::DUMP_GAME:
        return "DumpGame";
    case Command::UNKNOWN:
        break;
    }
    return "Unknown";
}

const char *status_name(Status status)
{
    switch (status)
    {
    case Status::PROTOCOL_ERROR:
        return "ProtocolError";
    case Status::NO_DISC:
        return "NoDisc";
    case Status::COULD_NOT_EJECT:
        return "CouldNotEject";
    case Status::UNKNOWN_DISC_TYPE:
        return "UnknownDiscType";
    case Status::OK:
        return "OK";
    case Status::DISC_INFO:
        return "DiscInfo";
    case Status::BCA:
        return "BCA";
    case Status::GAME:
        return "Game";
    case Status::UNEXPECTED:
        break;
    }
    return "Unexpected";
}
