#include "ymodem/log.hpp"
#include "ymodem/constants.hpp"

namespace ymodem {

Logger stderr_logger() {
    return [](const std::string& line) {
        std::fprintf(stderr, "%s\n", line.c_str());
    };
}

std::string hex_dump(std::span<const uint8_t> bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::string control_name(uint8_t byte) {
    switch (byte) {
    case SOH: return "SOH";
    case STX: return "STX";
    case EOT: return "EOT";
    case ACK: return "ACK";
    case NAK: return "NAK";
    case CAN: return "CAN";
    case CRC_REQUEST: return "'C'";
    default: break;
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", byte);
    return buf;
}

} // namespace ymodem
