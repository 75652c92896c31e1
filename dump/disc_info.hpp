#ifndef DISC_INFO_HPP
#define DISC_INFO_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "byte_stream.hpp"

enum class DiscType : uint8_t
{
    GC = 0,
    WII_SINGLE_SIDED = 1,
    WII_DOUBLE_SIDED = 2
};

NLOHMANN_JSON_SERIALIZE_ENUM(DiscType, {
                                           {DiscType::GC, "GC"},
                                           {DiscType::WII_SINGLE_SIDED, "WiiSingleSided"},
                                           {DiscType::WII_DOUBLE_SIDED, "WiiDoubleSided"},
                                       })

struct DiscInfo
{
    DiscType disc_type;
    std::string game_name;
    std::string internal_name;
};

void to_json(nlohmann::json &j, const DiscInfo &info);

DiscType disc_type_from_byte(uint8_t value);
const char *disc_type_display_name(DiscType type);

// Strips trailing NULs only and requires the rest to be valid UTF-8.
std::string decode_name_field(const uint8_t *data, size_t len);

/*
    Disc info payload, no length prefix:
        u8: disc type
        32 bytes: game name, NUL padded
        512 bytes: internal name, NUL padded
 */
DiscInfo decode_disc_info(const uint8_t *data, size_t len);

// Always consumes the whole payload before decoding, so a DecodeError
// leaves the stream in sync.
DiscInfo read_disc_info(ByteStream &stream);

void print_disc_info(std::ostream &out, const DiscInfo &info);
void write_disc_info_json(const std::string &path, const DiscInfo &info);

#endif
