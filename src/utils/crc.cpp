#include "ymodem/utils/crc.hpp"

namespace ymodem::utils {

uint16_t Crc16Xmodem::compute(const uint8_t* data, size_t len) const {
    uint16_t crc = init;
    for (size_t i = 0; i < len; ++i) {
        crc ^= (uint16_t)data[i] << 8;
        for (int b = 0; b < 8; ++b) {
            if (crc & 0x8000u) crc = (uint16_t)((crc << 1) ^ poly);
            else               crc = (uint16_t)(crc << 1);
        }
    }
    crc ^= xorout;
    return crc;
}

std::pair<uint8_t,uint8_t> Crc16Xmodem::make_trailer_be(const uint8_t* data, size_t len) const {
    uint16_t c = compute(data, len);
    return { uint8_t((c >> 8) & 0xFF), uint8_t(c & 0xFF) };
}

uint16_t crc16(std::span<const uint8_t> data) {
    return Crc16Xmodem{}.compute(data.data(), data.size());
}

} // namespace ymodem::utils
