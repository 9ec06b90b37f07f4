#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "ymodem/constants.hpp"

namespace ymodem::tx {

// Build one data packet:
//   [SOH|STX, block, 0xFF-block] ++ payload(packet_size) ++ crc16(payload) BE
// `chunk` is padded on the right with FILLER_BYTE; bytes past packet_size are
// ignored. `packet_size` selects SOH for 128 and STX for anything else.
std::vector<uint8_t> build_data_packet(std::span<const uint8_t> chunk,
                                       uint8_t block,
                                       std::size_t packet_size);

// Block-0 header: filename, 0x00, ASCII decimal size, zero-filled to 128.
// A name that fills the block is written without terminator; whatever does
// not fit is dropped.
std::vector<uint8_t> build_header_packet(std::string_view filename, uint64_t file_size);

// End-of-batch marker, i.e. the header packet for ("", 0).
std::vector<uint8_t> build_terminator_packet();

// True when name, separator and decimal size all fit in the header block.
bool header_fits(std::string_view filename, uint64_t file_size);

} // namespace ymodem::tx
