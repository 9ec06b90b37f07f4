#include "ymodem/tx/chunker.hpp"
#include "ymodem/constants.hpp"
#include "ymodem/tx/packet.hpp"

#include <algorithm>
#include <stdexcept>

namespace ymodem::tx {

std::vector<Chunk> plan_chunks(std::size_t file_size) {
    std::vector<Chunk> chunks;
    chunks.reserve(file_size / PACKET_SIZE_1024 + 1);

    uint8_t block = 1;
    for (std::size_t offset = 0; offset < file_size; ) {
        const std::size_t remaining = file_size - offset;
        Chunk c;
        c.offset = offset;
        c.packet_size = remaining <= PACKET_SIZE_128 ? PACKET_SIZE_128 : PACKET_SIZE_1024;
        c.length = std::min(remaining, c.packet_size);
        c.block = block++; // uint8_t wrap is the protocol's modulo-256
        chunks.push_back(c);
        offset += c.length;
    }
    return chunks;
}

std::vector<uint8_t> build_chunk_packet(std::span<const uint8_t> file, const Chunk& chunk) {
    if (chunk.offset + chunk.length > file.size()) {
        throw std::out_of_range("chunk exceeds file bounds");
    }
    return build_data_packet(file.subspan(chunk.offset, chunk.length), chunk.block, chunk.packet_size);
}

} // namespace ymodem::tx
