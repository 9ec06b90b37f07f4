#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ymodem {

// Session steps, in the order they run.
enum class Phase {
    Validate,
    AwaitReady,
    SendHeader,
    AwaitDataReady,
    SendData,
    SendEot1,
    SendEot2,
    AwaitTerminatorReady,
    SendTerminator,
    Done,
};

enum class ErrorKind {
    Timeout,
    TransportWriteFailure,
    InvalidInput,
};

const char* to_string(Phase phase);
const char* to_string(ErrorKind kind);

// Fatal transfer failure. Every error aborts the whole session; the phase and
// the control bytes that were expected are kept for the operator's log.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, Phase phase, const std::string& detail,
                  std::vector<uint8_t> expected = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] Phase phase() const noexcept { return phase_; }
    [[nodiscard]] const std::vector<uint8_t>& expected() const noexcept { return expected_; }

private:
    ErrorKind kind_;
    Phase phase_;
    std::vector<uint8_t> expected_;
};

} // namespace ymodem
