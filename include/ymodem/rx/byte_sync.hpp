#pragma once

#include "ymodem/constants.hpp"
#include "ymodem/error.hpp"
#include "ymodem/log.hpp"
#include "ymodem/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace ymodem::rx {

// `ByteSynchronizer` turns the transport's pushed chunks into a blocking
// "next control byte" primitive. Every chunk is appended to a private receive
// buffer; a wait scans the buffer left to right for the first byte in its
// accept set, then drops that byte and everything before it. Bytes that are
// not accepted (line noise, echoed text, terminal escape sequences) are
// skipped silently, which is what lets the sender resync on a chatty line.
//
// The subscription lives exactly as long as the synchronizer, so a reply that
// lands between a write and the following wait is buffered rather than lost.
// One synchronizer serves one transfer session.
class ByteSynchronizer {
public:
    // `trace` (optional) receives a "BUFFER:<hex>" line on every chunk.
    explicit ByteSynchronizer(ITransport& transport, Logger trace = {});

    ByteSynchronizer(const ByteSynchronizer&) = delete;
    ByteSynchronizer& operator=(const ByteSynchronizer&) = delete;

    // Block until a byte from `accept` is available and return it. Bytes
    // already buffered by earlier chunks are examined first. Throws
    // TransferError(Timeout, phase) once `timeout` elapses without a match.
    // Only one wait may be outstanding; a concurrent call throws
    // std::logic_error.
    [[nodiscard]] uint8_t wait_for_byte(std::span<const uint8_t> accept,
                                        std::chrono::milliseconds timeout,
                                        Phase phase);

    // Convenience for the common single-byte case.
    [[nodiscard]] uint8_t wait_for_byte(uint8_t accept,
                                        std::chrono::milliseconds timeout,
                                        Phase phase);

    // Unconsumed bytes currently held in the receive buffer.
    [[nodiscard]] std::size_t buffered() const;

private:
    // Chunk arrival handler; runs on the transport's thread.
    void on_chunk(std::span<const uint8_t> chunk);

    // Scan from scan_pos_ for an accepted byte. On a match erase the prefix
    // through it and reset the cursor. Caller holds mutex_.
    std::optional<uint8_t> extract_locked();

    Logger trace_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    // Bytes received and not yet consumed
    std::vector<uint8_t> buffer_;

    // Bytes [0, scan_pos_) are known not to contain any byte of accept_
    std::size_t scan_pos_ = 0;

    // Accept set of the outstanding wait
    std::vector<uint8_t> accept_;

    bool waiting_ = false;
    std::optional<uint8_t> matched_;

    // Declared last: released before the buffer it feeds is destroyed
    ScopedSubscription subscription_;
};

} // namespace ymodem::rx
