#include "ymodem/session.hpp"
#include "ymodem/rx/byte_sync.hpp"
#include "ymodem/tx/chunker.hpp"
#include "ymodem/tx/packet.hpp"

#include <exception>
#include <string>
#include <vector>

namespace ymodem {

namespace {

void validate_input(const std::string& filename, std::span<const uint8_t> file) {
    if (filename.empty()) {
        throw TransferError(ErrorKind::InvalidInput, Phase::Validate, "file name is empty");
    }
    if (filename.find('\0') != std::string::npos) {
        throw TransferError(ErrorKind::InvalidInput, Phase::Validate, "file name contains NUL");
    }
    if (!tx::header_fits(filename, file.size())) {
        throw TransferError(ErrorKind::InvalidInput, Phase::Validate,
                            "name '" + filename + "' and size " + std::to_string(file.size()) +
                                " do not fit in the " + std::to_string(PACKET_SIZE_128) + "-byte header block");
    }
}

// One transfer, start to finish. Owns the receive side for its duration.
class TransferSession {
public:
    TransferSession(ITransport& transport,
                    const std::string& filename,
                    std::span<const uint8_t> file,
                    const ProgressCallback& on_progress,
                    const Logger& logger,
                    const TransferParams& params)
        : transport_(transport),
          filename_(filename),
          file_(file),
          on_progress_(on_progress),
          logger_(logger),
          params_(params),
          chunks_(tx::plan_chunks(file.size())),
          sync_(transport, params.trace_buffer ? buffer_tracer(logger) : Logger{}) {}

    TransferResult run() {
        TransferResult result;
        result.file_path = filename_;
        result.total_bytes = file_.size();

        log("sending '" + filename_ + "' (" + std::to_string(file_.size()) + " bytes, " +
            std::to_string(chunks_.size()) + " packets) via " + transport_.name());

        expect(Phase::AwaitReady, CRC_REQUEST);
        send(Phase::SendHeader, tx::build_header_packet(filename_, file_.size()));
        expect(Phase::SendHeader, ACK);
        expect(Phase::AwaitDataReady, CRC_REQUEST);

        log(std::string("[") + to_string(Phase::SendData) + "] starting data packets");
        for (std::size_t i = 0; i < chunks_.size(); ++i) {
            const auto& chunk = chunks_[i];
            send(Phase::SendData, tx::build_chunk_packet(file_, chunk));
            (void)sync_.wait_for_byte(ACK, params_.timeout, Phase::SendData);
            result.written_bytes += chunk.length;
            if (params_.trace_packets) {
                log("[send-data] block " + std::to_string(chunk.block) + " (" +
                    std::to_string(chunk.length) + "/" + std::to_string(chunk.packet_size) + ") ACK " +
                    std::to_string(i + 1) + "/" + std::to_string(chunks_.size()));
            }
            if (on_progress_) {
                on_progress_(i + 1, chunks_.size());
            }
        }

        const uint8_t eot[] = {EOT};
        send(Phase::SendEot1, eot);
        expect(Phase::SendEot1, NAK);
        send(Phase::SendEot2, eot);
        expect(Phase::SendEot2, ACK);

        // single-file batch: the terminator announces "no more files"
        expect(Phase::AwaitTerminatorReady, CRC_REQUEST);
        send(Phase::SendTerminator, tx::build_terminator_packet());
        expect(Phase::SendTerminator, ACK);

        log(std::string("[") + to_string(Phase::Done) + "] transfer complete, " +
            std::to_string(result.written_bytes) + "/" + std::to_string(result.total_bytes) + " bytes");
        return result;
    }

private:
    static Logger buffer_tracer(const Logger& logger) {
        if (!logger) {
            return {};
        }
        return [&logger](const std::string& line) { logger("[YMODEM] " + line); };
    }

    void log(const std::string& msg) const {
        if (logger_) {
            logger_("[YMODEM] " + msg);
        }
    }

    void send(Phase phase, std::span<const uint8_t> bytes) {
        if (phase != Phase::SendData) {
            log(std::string("[") + to_string(phase) + "] write " + std::to_string(bytes.size()) + " bytes");
        }
        try {
            transport_.write(bytes);
        } catch (const std::exception& ex) {
            throw TransferError(ErrorKind::TransportWriteFailure, phase, ex.what());
        }
    }

    void expect(Phase phase, uint8_t byte) {
        log(std::string("[") + to_string(phase) + "] waiting for " + control_name(byte));
        const uint8_t got = sync_.wait_for_byte(byte, params_.timeout, phase);
        log(std::string("[") + to_string(phase) + "] got " + control_name(got));
    }

    ITransport& transport_;
    const std::string& filename_;
    std::span<const uint8_t> file_;
    const ProgressCallback& on_progress_;
    const Logger& logger_;
    const TransferParams& params_;
    std::vector<tx::Chunk> chunks_;
    rx::ByteSynchronizer sync_;
};

} // namespace

TransferResult transfer(ITransport& transport,
                        const std::string& filename,
                        std::span<const uint8_t> file,
                        const ProgressCallback& on_progress,
                        const Logger& logger,
                        const TransferParams& params) {
    validate_input(filename, file);
    TransferSession session(transport, filename, file, on_progress, logger, params);
    return session.run();
}

} // namespace ymodem
