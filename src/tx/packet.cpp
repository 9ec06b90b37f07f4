#include "ymodem/tx/packet.hpp"
#include "ymodem/utils/crc.hpp"

#include <algorithm>
#include <string>

namespace ymodem::tx {

namespace {

std::vector<uint8_t> frame_payload(uint8_t kind, uint8_t block, const std::vector<uint8_t>& payload) {
    utils::Crc16Xmodem crc16;
    auto trailer = crc16.make_trailer_be(payload.data(), payload.size());

    std::vector<uint8_t> packet;
    packet.reserve(PACKET_HEAD_LEN + payload.size() + PACKET_TRAIL_LEN);
    packet.push_back(kind);
    packet.push_back(block);
    packet.push_back(static_cast<uint8_t>(0xFF - block));
    packet.insert(packet.end(), payload.begin(), payload.end());
    packet.push_back(trailer.first);
    packet.push_back(trailer.second);
    return packet;
}

} // namespace

std::vector<uint8_t> build_data_packet(std::span<const uint8_t> chunk,
                                       uint8_t block,
                                       std::size_t packet_size) {
    const uint8_t kind = packet_size == PACKET_SIZE_128 ? SOH : STX;
    const std::size_t size = kind == SOH ? PACKET_SIZE_128 : PACKET_SIZE_1024;

    // CRC covers the padded payload, never the raw chunk
    std::vector<uint8_t> payload(size, FILLER_BYTE);
    const std::size_t take = std::min(chunk.size(), size);
    std::copy(chunk.begin(), chunk.begin() + (ptrdiff_t)take, payload.begin());

    return frame_payload(kind, block, payload);
}

std::vector<uint8_t> build_header_packet(std::string_view filename, uint64_t file_size) {
    std::vector<uint8_t> payload(PACKET_SIZE_128, 0x00);

    const std::size_t name_len = std::min(filename.size(), PACKET_SIZE_128);
    std::copy(filename.begin(), filename.begin() + (ptrdiff_t)name_len, payload.begin());

    // size goes after the 0x00 separator; it is silently cut at the block end
    const std::string size_str = std::to_string(file_size);
    std::size_t pos = name_len + 1;
    for (char c : size_str) {
        if (pos >= payload.size()) break;
        payload[pos++] = static_cast<uint8_t>(c);
    }

    return frame_payload(SOH, 0x00, payload);
}

std::vector<uint8_t> build_terminator_packet() {
    return build_header_packet("", 0);
}

bool header_fits(std::string_view filename, uint64_t file_size) {
    return filename.size() + 1 + std::to_string(file_size).size() <= PACKET_SIZE_128;
}

} // namespace ymodem::tx
