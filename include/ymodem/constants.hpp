#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace ymodem {

// Control bytes exchanged on the wire.
inline constexpr uint8_t SOH = 0x01; // start of 128-byte packet
inline constexpr uint8_t STX = 0x02; // start of 1024-byte packet
inline constexpr uint8_t EOT = 0x04;
inline constexpr uint8_t ACK = 0x06;
inline constexpr uint8_t NAK = 0x15;
inline constexpr uint8_t CAN = 0x18; // never sent by the sender
inline constexpr uint8_t CRC_REQUEST = 0x43; // 'C'

inline constexpr std::size_t PACKET_SIZE_128  = 128;
inline constexpr std::size_t PACKET_SIZE_1024 = 1024;

// [type][block][~block] ... [crc_hi][crc_lo]
inline constexpr std::size_t PACKET_HEAD_LEN  = 3;
inline constexpr std::size_t PACKET_TRAIL_LEN = 2;

inline constexpr uint8_t FILLER_BYTE = 0x1A;

inline constexpr std::chrono::milliseconds DEFAULT_WAIT_TIMEOUT{10000};

} // namespace ymodem
