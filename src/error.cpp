#include "ymodem/error.hpp"
#include "ymodem/log.hpp"

#include <utility>

namespace ymodem {

namespace {

std::string format_message(ErrorKind kind, Phase phase, const std::string& detail,
                           const std::vector<uint8_t>& expected) {
    std::string msg = std::string(to_string(kind)) + " in " + to_string(phase);
    if (!expected.empty()) {
        msg += " (expected ";
        for (std::size_t i = 0; i < expected.size(); ++i) {
            if (i) msg += '|';
            msg += control_name(expected[i]);
        }
        msg += ')';
    }
    if (!detail.empty()) {
        msg += ": " + detail;
    }
    return msg;
}

} // namespace

const char* to_string(Phase phase) {
    switch (phase) {
    case Phase::Validate: return "validate";
    case Phase::AwaitReady: return "await-ready";
    case Phase::SendHeader: return "send-header";
    case Phase::AwaitDataReady: return "await-data-ready";
    case Phase::SendData: return "send-data";
    case Phase::SendEot1: return "send-eot-1";
    case Phase::SendEot2: return "send-eot-2";
    case Phase::AwaitTerminatorReady: return "await-terminator-ready";
    case Phase::SendTerminator: return "send-terminator";
    case Phase::Done: return "done";
    }
    return "?";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::TransportWriteFailure: return "transport write failure";
    case ErrorKind::InvalidInput: return "invalid input";
    }
    return "?";
}

TransferError::TransferError(ErrorKind kind, Phase phase, const std::string& detail,
                             std::vector<uint8_t> expected)
    : std::runtime_error(format_message(kind, phase, detail, expected)),
      kind_(kind),
      phase_(phase),
      expected_(std::move(expected)) {}

} // namespace ymodem
