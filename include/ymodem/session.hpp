#pragma once

#include "ymodem/constants.hpp"
#include "ymodem/error.hpp"
#include "ymodem/log.hpp"
#include "ymodem/transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>

namespace ymodem {

struct TransferParams {
    // Upper bound for every control-byte wait (ready, ACK, NAK).
    std::chrono::milliseconds timeout = DEFAULT_WAIT_TIMEOUT;
    // Log one line per acknowledged data packet.
    bool trace_packets = false;
    // Log the receive buffer as hex every time a chunk arrives.
    bool trace_buffer = false;
};

struct TransferResult {
    // Name announced in the header packet.
    std::string file_path;
    // File size announced in the header packet.
    uint64_t total_bytes = 0;
    // Data bytes whose packets were acknowledged.
    uint64_t written_bytes = 0;
};

// (packets acknowledged so far, total data packets)
using ProgressCallback = std::function<void(std::size_t, std::size_t)>;

// Send one file over `transport` with YMODEM (CRC-16, 1K blocks, single-file
// batch). Blocks until the receiver has acknowledged the end-of-batch packet.
//
// The session runs strictly in lockstep:
//   'C' -> header -> ACK -> 'C' -> { data -> ACK }* -> EOT -> NAK -> EOT -> ACK
//   -> 'C' -> terminator -> ACK
// Any missed reply or failed write throws TransferError and ends the session;
// nothing is retried. Input is validated before the first byte is exchanged.
TransferResult transfer(ITransport& transport,
                        const std::string& filename,
                        std::span<const uint8_t> file,
                        const ProgressCallback& on_progress = {},
                        const Logger& logger = stderr_logger(),
                        const TransferParams& params = {});

} // namespace ymodem
