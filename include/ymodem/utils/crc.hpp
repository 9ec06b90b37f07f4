#pragma once
#include <cstdint>
#include <cstddef>
#include <span>
#include <utility>

namespace ymodem::utils {

// CRC-16/XMODEM by default. The fields stay configurable so the same engine
// can reproduce the CCITT-FALSE variant (init 0xFFFF) in tests and tools.
struct Crc16Xmodem {
    uint16_t poly   = 0x1021;
    uint16_t init   = 0x0000;
    uint16_t xorout = 0x0000;


    uint16_t compute(const uint8_t* data, size_t len) const;

    // CRC of data[0..len) as {msb, lsb}, the order it goes on the wire.
    std::pair<uint8_t,uint8_t> make_trailer_be(const uint8_t* data, size_t len) const;
};

// Packet checksum: CRC-16/XMODEM over the whole (padded) payload.
uint16_t crc16(std::span<const uint8_t> data);

} // namespace ymodem::utils
