#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ymodem::tx {

// One slice of the file and the packet that carries it.
struct Chunk {
    std::size_t offset = 0;
    std::size_t length = 0;      // real data bytes (<= packet_size)
    uint8_t block = 1;           // wraps 255 -> 0
    std::size_t packet_size = 0; // 128 or 1024
};

// Split `file_size` bytes into chunks, left to right. Every chunk is 1024
// bytes except the tail; a tail of 128 bytes or less goes out in a 128-byte
// packet. Blocks start at 1.
std::vector<Chunk> plan_chunks(std::size_t file_size);

// Wire bytes for one planned chunk of `file`.
std::vector<uint8_t> build_chunk_packet(std::span<const uint8_t> file, const Chunk& chunk);

} // namespace ymodem::tx
