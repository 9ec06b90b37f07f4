#include <gtest/gtest.h>
#include "ymodem/constants.hpp"
#include "ymodem/tx/packet.hpp"
#include "ymodem/utils/crc.hpp"
#include <algorithm>
#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <vector>

using namespace ymodem;
using namespace ymodem::tx;

namespace {

std::span<const uint8_t> payload_of(const std::vector<uint8_t>& packet) {
    return std::span<const uint8_t>(packet).subspan(PACKET_HEAD_LEN, packet.size() - PACKET_HEAD_LEN - PACKET_TRAIL_LEN);
}

uint16_t trailer_of(const std::vector<uint8_t>& packet) {
    return static_cast<uint16_t>((packet[packet.size() - 2] << 8) | packet[packet.size() - 1]);
}

} // namespace

TEST(DataPacket, LayoutForEveryLength) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> dist(0, 255);

    for (std::size_t size : {PACKET_SIZE_128, PACKET_SIZE_1024}) {
        for (std::size_t len : {std::size_t(0), std::size_t(1), std::size_t(2), size / 2, size - 1, size}) {
            std::vector<uint8_t> chunk(len);
            for (auto& b : chunk) b = static_cast<uint8_t>(dist(rng));

            auto packet = build_data_packet(chunk, 7, size);
            ASSERT_EQ(packet.size(), PACKET_HEAD_LEN + size + PACKET_TRAIL_LEN);
            EXPECT_EQ(packet[0], size == PACKET_SIZE_128 ? SOH : STX);
            EXPECT_EQ(packet[1], 7);
            EXPECT_EQ(packet[2], 0xFF - 7);

            auto payload = payload_of(packet);
            EXPECT_TRUE(std::equal(chunk.begin(), chunk.end(), payload.begin()));
            EXPECT_TRUE(std::all_of(payload.begin() + (ptrdiff_t)len, payload.end(),
                                    [](uint8_t b) { return b == FILLER_BYTE; }));
            EXPECT_EQ(trailer_of(packet), utils::crc16(payload));
        }
    }
}

TEST(DataPacket, CrcCoversPaddingNotRawData) {
    std::vector<uint8_t> chunk = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    auto packet = build_data_packet(chunk, 1, PACKET_SIZE_128);
    EXPECT_EQ(trailer_of(packet), 0xE447);
    EXPECT_NE(trailer_of(packet), utils::crc16(chunk));
}

TEST(DataPacket, ComplementForAllBlocks) {
    std::vector<uint8_t> chunk = {0x01, 0x02};
    for (int block = 0; block <= 255; ++block) {
        auto packet = build_data_packet(chunk, static_cast<uint8_t>(block), PACKET_SIZE_128);
        ASSERT_EQ(packet[1], block);
        ASSERT_EQ(packet[2], 0xFF - block);
        ASSERT_EQ(static_cast<uint8_t>(packet[1] + packet[2]), 0xFF);
    }
}

TEST(DataPacket, OversizedChunkIsTruncated) {
    std::vector<uint8_t> chunk(200, 0x55);
    auto packet = build_data_packet(chunk, 1, PACKET_SIZE_128);
    ASSERT_EQ(packet.size(), PACKET_HEAD_LEN + PACKET_SIZE_128 + PACKET_TRAIL_LEN);
    auto payload = payload_of(packet);
    EXPECT_TRUE(std::all_of(payload.begin(), payload.end(), [](uint8_t b) { return b == 0x55; }));
}

TEST(HeaderPacket, NameNulSize) {
    auto packet = build_header_packet("a.js", 2050);
    ASSERT_EQ(packet.size(), PACKET_HEAD_LEN + PACKET_SIZE_128 + PACKET_TRAIL_LEN);
    EXPECT_EQ(packet[0], SOH);
    EXPECT_EQ(packet[1], 0x00);
    EXPECT_EQ(packet[2], 0xFF);

    auto payload = payload_of(packet);
    const std::string expected_prefix("a.js\0" "2050", 9);
    EXPECT_TRUE(std::equal(expected_prefix.begin(), expected_prefix.end(), payload.begin()));
    EXPECT_TRUE(std::all_of(payload.begin() + 9, payload.end(), [](uint8_t b) { return b == 0x00; }));
    EXPECT_EQ(trailer_of(packet), 0xAE42);
}

TEST(HeaderPacket, TerminatorIsEmptyHeader) {
    auto term = build_terminator_packet();
    EXPECT_EQ(term, build_header_packet("", 0));
    auto payload = payload_of(term);
    // "" + NUL + "0"
    EXPECT_EQ(payload[0], 0x00);
    EXPECT_EQ(payload[1], '0');
    EXPECT_TRUE(std::all_of(payload.begin() + 2, payload.end(), [](uint8_t b) { return b == 0x00; }));
    EXPECT_EQ(trailer_of(term), utils::crc16(payload));
}

TEST(HeaderPacket, LongNameIsCutAtBlockEnd) {
    std::string name(PACKET_SIZE_128, 'n');
    auto packet = build_header_packet(name, 12345);
    auto payload = payload_of(packet);
    EXPECT_TRUE(std::all_of(payload.begin(), payload.end(), [](uint8_t b) { return b == 'n'; }));

    // room for the separator but only part of the size
    std::string almost(PACKET_SIZE_128 - 3, 'x');
    auto cut = payload_of(build_header_packet(almost, 12345));
    EXPECT_EQ(cut[PACKET_SIZE_128 - 3], 0x00);
    EXPECT_EQ(cut[PACKET_SIZE_128 - 2], '1');
    EXPECT_EQ(cut[PACKET_SIZE_128 - 1], '2');
}

TEST(HeaderPacket, Fits) {
    EXPECT_TRUE(header_fits("a.js", 2050));
    EXPECT_TRUE(header_fits(std::string(PACKET_SIZE_128 - 2, 'x'), 7));
    EXPECT_FALSE(header_fits(std::string(PACKET_SIZE_128 - 1, 'x'), 7));
    EXPECT_FALSE(header_fits(std::string(PACKET_SIZE_128 - 4, 'x'), 2050));
}
