#pragma once

#include <cstdint>
#include <cstdio>
#include <functional>
#include <span>
#include <string>

// printf-style diagnostics for the serial layer; compiled out with NDEBUG
#ifndef NDEBUG
#define YMODEM_DEBUGF(fmt, ...) std::fprintf(stderr, "[DEBUG] " fmt "\n", ##__VA_ARGS__)
#else
#define YMODEM_DEBUGF(fmt, ...) ((void)0)
#endif

namespace ymodem {

// Line sink used by the transfer engine. Lines carry no trailing newline.
using Logger = std::function<void(const std::string&)>;

// Writes each line to stderr.
Logger stderr_logger();

// Lowercase hex without separators, e.g. "0643".
std::string hex_dump(std::span<const uint8_t> bytes);

// Printable name of a control byte ("ACK", "'C'", ...) or "0x.." otherwise.
std::string control_name(uint8_t byte);

} // namespace ymodem
