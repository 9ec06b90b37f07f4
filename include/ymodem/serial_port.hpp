#pragma once

#include "ymodem/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace ymodem {

struct SerialConfig {
    // Line rate; 9600..921600 (standard termios rates only).
    uint32_t baud_rate = 115200;
    // Pause after open before the first I/O, for boards that reset on open.
    std::chrono::milliseconds settle_delay{0};
    // poll() period of the reader thread; bounds how fast close() returns.
    std::chrono::milliseconds poll_interval{50};
    // Longest a single write() may wait for the driver queue to drain.
    std::chrono::milliseconds write_timeout{5000};
};

// POSIX TTY in raw 8N1 mode. A reader thread polls the descriptor and pushes
// whatever arrives to subscribers; write() loops until everything is queued
// to the driver, and throws std::system_error(ETIMEDOUT) when the queue does
// not drain within `write_timeout`. close() from another thread makes a
// blocked write() throw. The port closes itself on destruction.
class SerialPort : public ITransport {
public:
    // Opens and configures `device`; throws std::system_error on failure and
    // std::invalid_argument for an unsupported baud rate.
    SerialPort(const std::string& device, const SerialConfig& config = {});
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    void write(std::span<const uint8_t> data) override;
    SubscriptionId subscribe(ChunkHandler handler) override;
    void unsubscribe(SubscriptionId id) override;
    const char* name() const override { return device_.c_str(); }

    // Drive the RTS modem line.
    void set_rts(bool asserted);
    // Assert RTS for `width`, then release it (board reset on most USB-UART
    // adapters wired to EN/RESET).
    void pulse_rts(std::chrono::milliseconds width = std::chrono::milliseconds(100));

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    // Stop the reader and release the descriptor. A write in progress and
    // any later write throw std::runtime_error.
    void close();

private:
    void reader_loop();

    std::string device_;
    SerialConfig config_;
    int fd_ = -1;
    std::mutex write_mutex_;
    ChunkDispatcher dispatcher_;
    std::atomic<bool> running_{false};
    std::thread reader_;
};

} // namespace ymodem
