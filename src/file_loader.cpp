#include "ymodem/file_loader.hpp"

#include <fstream>
#include <stdexcept>

namespace ymodem {

// Assumptions:
//  - The transfer holds the whole file in memory; files sent this way are
//    scripts and assets for a small target, not bulk data.
// Behavior:
//  - Refuses directories and other non-regular paths up front.
//  - Throws std::runtime_error on open/read failures.
std::vector<uint8_t> FileLoader::load(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("Not a regular file: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    file.seekg(0, std::ios::end);
    const std::streampos file_size = file.tellg();
    if (file_size < 0) {
        throw std::runtime_error("Failed to size file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<std::size_t>(file_size));
    if (!bytes.empty()) {
        file.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            throw std::runtime_error("Failed to read file: " + path.string());
        }
    }
    return bytes;
}

std::string FileLoader::remote_name(const std::filesystem::path &path) {
    return path.filename().string();
}

} // namespace ymodem
