#include "ymodem/rx/byte_sync.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace ymodem::rx {

ByteSynchronizer::ByteSynchronizer(ITransport& transport, Logger trace)
    : trace_(std::move(trace)),
      subscription_(transport, [this](std::span<const uint8_t> chunk) { on_chunk(chunk); }) {}

uint8_t ByteSynchronizer::wait_for_byte(std::span<const uint8_t> accept,
                                        std::chrono::milliseconds timeout,
                                        Phase phase) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (waiting_) {
        throw std::logic_error("wait_for_byte: another wait is outstanding");
    }

    // A new accept set invalidates what earlier scans learned
    accept_.assign(accept.begin(), accept.end());
    scan_pos_ = 0;
    matched_.reset();

    if (auto hit = extract_locked()) {
        accept_.clear();
        return *hit;
    }

    waiting_ = true;
    const bool got = cv_.wait_for(lock, timeout, [this] { return matched_.has_value(); });
    waiting_ = false;

    std::vector<uint8_t> expected;
    expected.swap(accept_);
    if (!got) {
        throw TransferError(ErrorKind::Timeout, phase,
                            "no reply within " + std::to_string(timeout.count()) + " ms",
                            std::move(expected));
    }

    const uint8_t byte = *matched_;
    matched_.reset();
    return byte;
}

uint8_t ByteSynchronizer::wait_for_byte(uint8_t accept,
                                        std::chrono::milliseconds timeout,
                                        Phase phase) {
    const uint8_t set[] = {accept};
    return wait_for_byte(std::span<const uint8_t>(set, 1), timeout, phase);
}

std::size_t ByteSynchronizer::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

void ByteSynchronizer::on_chunk(std::span<const uint8_t> chunk) {
    std::string line;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());
        if (trace_) {
            line = "BUFFER:" + hex_dump(buffer_);
        }
        if (waiting_ && !matched_) {
            if (auto hit = extract_locked()) {
                matched_ = hit;
                cv_.notify_one();
            }
        }
    }
    // emitted unlocked: the logger may call back into buffered()
    if (!line.empty()) {
        trace_(line);
    }
}

std::optional<uint8_t> ByteSynchronizer::extract_locked() {
    const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(scan_pos_);
    const auto it = std::find_first_of(begin, buffer_.end(), accept_.begin(), accept_.end());
    if (it == buffer_.end()) {
        scan_pos_ = buffer_.size();
        return std::nullopt;
    }
    const uint8_t byte = *it;
    buffer_.erase(buffer_.begin(), it + 1);
    scan_pos_ = 0;
    return byte;
}

} // namespace ymodem::rx
