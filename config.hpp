#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>

constexpr const char *PROGRAM_VERSION = "1.0.0";

constexpr uint16_t DEFAULT_PORT = 9875;
constexpr uint32_t DEFAULT_PROTOCOL_VERSION = 1;
constexpr size_t IO_SIZE = 32768;

constexpr const char *MAGIC_NUMBER = "NETDUMP";
constexpr size_t MAGIC_SIZE = 7;
constexpr size_t FRAME_HEADER_SIZE = MAGIC_SIZE + 4;
constexpr size_t REQUEST_SIZE = FRAME_HEADER_SIZE + 4;

constexpr size_t DISC_TYPE_SIZE = 1;
constexpr size_t GAME_NAME_SIZE = 32;
constexpr size_t INTERNAL_NAME_SIZE = 512;
constexpr size_t DISC_INFO_SIZE = DISC_TYPE_SIZE + GAME_NAME_SIZE + INTERNAL_NAME_SIZE;
constexpr size_t BCA_SIZE = 64;

constexpr const char *DEFAULT_GAME_FILE = "game.iso";
constexpr const char *DEFAULT_BCA_FILE = "game.bca";
constexpr const char *DEFAULT_INFO_FILE = "info.json";

#endif
