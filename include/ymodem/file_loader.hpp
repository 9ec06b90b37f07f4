#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ymodem {

class FileLoader {
public:
    // Read a whole file into memory, byte for byte.
    // Throws std::runtime_error on open/read failures or when `path` is not
    // a regular file.
    static std::vector<uint8_t> load(const std::filesystem::path &path);

    // Name announced to the receiver: the last path component.
    static std::string remote_name(const std::filesystem::path &path);
};

} // namespace ymodem
