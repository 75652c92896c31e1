#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "dump/disc_info.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

TEST(DiscInfoTest, DiscTypeByteMapping)
{
    EXPECT_EQ(disc_type_from_byte(0x00), DiscType::GC);
    EXPECT_EQ(disc_type_from_byte(0x01), DiscType::WII_SINGLE_SIDED);
    EXPECT_EQ(disc_type_from_byte(0x02), DiscType::WII_DOUBLE_SIDED);
    EXPECT_THROW(disc_type_from_byte(0x03), DecodeError);
    EXPECT_THROW(disc_type_from_byte(0xFF), DecodeError);
}

TEST(DiscInfoTest, NameFieldTrimsTrailingNuls)
{
    std::vector<uint8_t> field(GAME_NAME_SIZE, 0);
    std::memcpy(field.data(), "MARIO", 5);
    EXPECT_EQ(decode_name_field(field.data(), field.size()), "MARIO");
}

TEST(DiscInfoTest, NameFieldKeepsEmbeddedNuls)
{
    std::vector<uint8_t> field = {'A', 0, 'B', 0, 0};
    EXPECT_EQ(decode_name_field(field.data(), field.size()), std::string("A\0B", 3));
}

TEST(DiscInfoTest, NameFieldAllNulsIsEmpty)
{
    std::vector<uint8_t> field(GAME_NAME_SIZE, 0);
    EXPECT_EQ(decode_name_field(field.data(), field.size()), "");
}

TEST(DiscInfoTest, NameFieldAcceptsMultiByteUtf8)
{
    // "ゼルダ" followed by padding
    std::vector<uint8_t> field = {0xE3, 0x82, 0xBC, 0xE3, 0x83, 0xAB, 0xE3, 0x83, 0x80, 0, 0};
    EXPECT_EQ(decode_name_field(field.data(), field.size()), "\xE3\x82\xBC\xE3\x83\xAB\xE3\x83\x80");
}

TEST(DiscInfoTest, NameFieldRejectsInvalidUtf8)
{
    std::vector<uint8_t> lone_continuation = {'A', 0x80, 0};
    EXPECT_THROW(decode_name_field(lone_continuation.data(), lone_continuation.size()), DecodeError);

    std::vector<uint8_t> truncated = {'A', 0xE3, 0x82};
    EXPECT_THROW(decode_name_field(truncated.data(), truncated.size()), DecodeError);

    std::vector<uint8_t> overlong = {0xC0, 0xAF};
    EXPECT_THROW(decode_name_field(overlong.data(), overlong.size()), DecodeError);

    std::vector<uint8_t> latin1 = {'C', 'a', 'f', 0xE9};
    EXPECT_THROW(decode_name_field(latin1.data(), latin1.size()), DecodeError);
}

TEST(DiscInfoTest, DecodesFullPayload)
{
    auto payload = disc_info_payload(1, "RMGE01", "Super Mario Galaxy");
    DiscInfo info = decode_disc_info(payload.data(), payload.size());
    EXPECT_EQ(info.disc_type, DiscType::WII_SINGLE_SIDED);
    EXPECT_EQ(info.game_name, "RMGE01");
    EXPECT_EQ(info.internal_name, "Super Mario Galaxy");
}

TEST(DiscInfoTest, DecodeRejectsWrongSize)
{
    auto payload = disc_info_payload(0, "GALE01", "Melee");
    EXPECT_THROW(decode_disc_info(payload.data(), payload.size() - 1), DecodeError);
}

TEST(DiscInfoTest, ReadConsumesExactlyTheFixedPayloadEvenOnDecodeError)
{
    MemoryStream stream;
    stream.input = disc_info_payload(3, "GALE01", "Melee");
    append(stream.input, response_frame(1, 0));

    EXPECT_THROW(read_disc_info(stream), DecodeError);
    EXPECT_EQ(stream.unread(), 15u);
}

TEST(DiscInfoTest, SummaryHasThreeLines)
{
    DiscInfo info{DiscType::GC, "GALE01", "Super Smash Bros Melee"};
    std::ostringstream out;
    print_disc_info(out, info);
    EXPECT_EQ(out.str(), "Disc Type: GameCube\n"
                         "Game Name: GALE01\n"
                         "Internal Name: Super Smash Bros Melee\n");
}

TEST(DiscInfoTest, JsonRecordShape)
{
    DiscInfo info{DiscType::WII_DOUBLE_SIDED, "RSBE01", "Super Smash Bros Brawl"};
    json j = info;
    EXPECT_EQ(j["disc_type"], "WiiDoubleSided");
    EXPECT_EQ(j["game_name"], "RSBE01");
    EXPECT_EQ(j["internal_name"], "Super Smash Bros Brawl");
    EXPECT_EQ(j.size(), 3u);
}

TEST(DiscInfoTest, WritesJsonFile)
{
    std::string path = ::testing::TempDir() + "netdump_info_test.json";
    DiscInfo info{DiscType::GC, "GALE01", "Melee"};
    write_disc_info_json(path, info);

    std::ifstream file(path);
    json j = json::parse(file);
    EXPECT_EQ(j["disc_type"], "GC");
    EXPECT_EQ(j["internal_name"], "Melee");
    std::remove(path.c_str());
}

TEST(DiscInfoTest, JsonFileInMissingDirectoryIsSinkError)
{
    DiscInfo info{DiscType::GC, "GALE01", "Melee"};
    EXPECT_THROW(write_disc_info_json("/nonexistent-dir/for/netdump/info.json", info), SinkError);
}
