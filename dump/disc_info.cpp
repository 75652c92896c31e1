#include "disc_info.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include "config.hpp"
#include "errors.hpp"

using json = nlohmann::json;

namespace
{
bool is_valid_utf8(const uint8_t *data, size_t len)
{
    size_t i = 0;
    while (i < len)
    {
        uint8_t c = data[i];
        size_t extra;
        uint32_t code_point;

        if (c < 0x80)
        {
            i++;
            continue;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            code_point = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            code_point = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            code_point = c & 0x07;
        }
        else
        {
            return false;
        }

        if (i + extra >= len)
            return false;

        for (size_t k = 1; k <= extra; ++k)
        {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80)
                return false;
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range code points
        if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF))
            return false;

        i += extra + 1;
    }
    return true;
}
} // namespace

void to_json(json &j, const DiscInfo &info)
{
    j = json{
        {"disc_type", info.disc_type},
        {"game_name", info.game_name},
        {"internal_name", info.internal_name},
    };
}

DiscType disc_type_from_byte(uint8_t value)
{
    switch (value)
    {
    case 0:
        return DiscType::GC;
    case 1:
        return DiscType::WII_SINGLE_SIDED;
    case 2:
        return DiscType::WII_DOUBLE_SIDED;
    }
    std::ostringstream message;
    message << "Unknown disc type byte 0x" << std::hex << static_cast<unsigned>(value);
    throw DecodeError(message.str());
}

const char *disc_type_display_name(DiscType type)
{
    switch (type)
    {
    case DiscType::GC:
        return "GameCube";
    case DiscType::WII_SINGLE_SIDED:
        return "Wii Single-Sided";
    case DiscType::WII_DOUBLE_SIDED:
        return "Wii Double-Sided";
    }
    return "Unknown";
}

std::string decode_name_field(const uint8_t *data, size_t len)
{
    while (len > 0 && data[len - 1] == 0)
        len--;

    if (!is_valid_utf8(data, len))
    {
        throw DecodeError("Name field is not valid UTF-8");
    }
    return std::string(reinterpret_cast<const char *>(data), len);
}

DiscInfo decode_disc_info(const uint8_t *data, size_t len)
{
    if (len != DISC_INFO_SIZE)
    {
        throw DecodeError("Disc info payload must be " + std::to_string(DISC_INFO_SIZE) + " bytes, got " +
                          std::to_string(len));
    }

    DiscInfo info;
    info.disc_type = disc_type_from_byte(data[0]);
    info.game_name = decode_name_field(data + DISC_TYPE_SIZE, GAME_NAME_SIZE);
    info.internal_name = decode_name_field(data + DISC_TYPE_SIZE + GAME_NAME_SIZE, INTERNAL_NAME_SIZE);
    return info;
}

DiscInfo read_disc_info(ByteStream &stream)
{
    uint8_t payload[DISC_INFO_SIZE];
    stream.read_exact(payload, sizeof(payload));
    return decode_disc_info(payload, sizeof(payload));
}

void print_disc_info(std::ostream &out, const DiscInfo &info)
{
    out << "Disc Type: " << disc_type_display_name(info.disc_type) << "\n";
    out << "Game Name: " << info.game_name << "\n";
    out << "Internal Name: " << info.internal_name << std::endl;
}

void write_disc_info_json(const std::string &path, const DiscInfo &info)
{
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file)
    {
        throw SinkError("Failed to open " + path + ": " + std::strerror(errno));
    }

    file << json(info).dump(2) << "\n";
    if (!file)
    {
        throw SinkError("Failed to write " + path);
    }
}
