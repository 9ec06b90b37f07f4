#include <gtest/gtest.h>
#include "ymodem/constants.hpp"
#include "ymodem/rx/byte_sync.hpp"
#include "ymodem/serial_port.hpp"
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace ymodem;
using namespace std::chrono_literals;

namespace {

// Master side of a pseudo-terminal; the slave path stands in for a board.
class PtyPair {
public:
    PtyPair() {
        master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ < 0 || ::grantpt(master_) != 0 || ::unlockpt(master_) != 0) {
            throw std::runtime_error("pty setup failed");
        }
        slave_path_ = ::ptsname(master_);
    }
    ~PtyPair() {
        if (master_ >= 0) ::close(master_);
    }

    const std::string& slave_path() const { return slave_path_; }

    void send(const std::vector<uint8_t>& bytes) {
        ASSERT_EQ(::write(master_, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    std::vector<uint8_t> receive(std::size_t want, int timeout_ms) {
        std::vector<uint8_t> out;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (out.size() < want && std::chrono::steady_clock::now() < deadline) {
            pollfd pfd{master_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            uint8_t buf[256];
            const ssize_t n = ::read(master_, buf, sizeof(buf));
            if (n > 0) out.insert(out.end(), buf, buf + n);
        }
        return out;
    }

private:
    int master_ = -1;
    std::string slave_path_;
};

} // namespace

TEST(SerialPort, OpenFailureNamesDevice) {
    try {
        SerialPort port("/dev/does-not-exist-ymodem");
        FAIL() << "expected open to fail";
    } catch (const std::system_error& ex) {
        EXPECT_NE(std::string(ex.what()).find("/dev/does-not-exist-ymodem"), std::string::npos);
    }
}

TEST(SerialPort, RejectsUnsupportedBaud) {
    PtyPair pty;
    SerialConfig cfg;
    cfg.baud_rate = 12345;
    EXPECT_THROW(SerialPort(pty.slave_path(), cfg), std::invalid_argument);
}

TEST(SerialPort, WriteReachesOtherEnd) {
    PtyPair pty;
    SerialPort port(pty.slave_path());
    const std::vector<uint8_t> packet = {SOH, 0x00, 0xFF, 0x1A, 0x00, 0x0D, 0x0A, 0x7F};
    port.write(packet);
    EXPECT_EQ(pty.receive(packet.size(), 2000), packet);
}

TEST(SerialPort, IncomingBytesReachSubscribers) {
    PtyPair pty;
    SerialPort port(pty.slave_path());

    std::mutex m;
    std::condition_variable cv;
    std::vector<uint8_t> got;
    const auto id = port.subscribe([&](std::span<const uint8_t> chunk) {
        std::lock_guard<std::mutex> lock(m);
        got.insert(got.end(), chunk.begin(), chunk.end());
        cv.notify_one();
    });

    pty.send({CRC_REQUEST, ACK, NAK});
    {
        std::unique_lock<std::mutex> lock(m);
        EXPECT_TRUE(cv.wait_for(lock, 2s, [&] { return got.size() >= 3; }));
    }
    port.unsubscribe(id);
    EXPECT_EQ(got, (std::vector<uint8_t>{CRC_REQUEST, ACK, NAK}));
}

TEST(SerialPort, DrivesByteSynchronizer) {
    PtyPair pty;
    SerialPort port(pty.slave_path());
    rx::ByteSynchronizer sync(port);

    pty.send({'l', 'o', 'g', '\n', CRC_REQUEST});
    EXPECT_EQ(sync.wait_for_byte(CRC_REQUEST, 2000ms, Phase::AwaitReady), CRC_REQUEST);
}

TEST(SerialPort, WriteAfterCloseThrows) {
    PtyPair pty;
    SerialPort port(pty.slave_path());
    EXPECT_TRUE(port.is_open());
    port.close();
    EXPECT_FALSE(port.is_open());
    const std::vector<uint8_t> eot = {EOT};
    EXPECT_THROW(port.write(eot), std::runtime_error);
    port.close();
}

TEST(SerialPort, StalledWriteTimesOut) {
    PtyPair pty;
    SerialConfig cfg;
    cfg.write_timeout = 300ms;
    SerialPort port(pty.slave_path(), cfg);

    // nobody reads the master, so the pty queue fills and stays full
    const std::vector<uint8_t> blob(1 << 20, 0x55);
    const auto start = std::chrono::steady_clock::now();
    try {
        port.write(blob);
        FAIL() << "expected the write to stall";
    } catch (const std::system_error& ex) {
        EXPECT_EQ(ex.code().value(), ETIMEDOUT);
        EXPECT_NE(std::string(ex.what()).find(pty.slave_path()), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    port.close();
}

TEST(SerialPort, CloseReleasesStalledWriter) {
    PtyPair pty;
    SerialConfig cfg;
    cfg.write_timeout = 60s;
    SerialPort port(pty.slave_path(), cfg);

    std::string writer_error;
    std::thread writer([&] {
        const std::vector<uint8_t> blob(1 << 20, 0x55);
        try {
            port.write(blob);
        } catch (const std::exception& ex) {
            writer_error = ex.what();
        }
    });

    std::this_thread::sleep_for(200ms);
    const auto start = std::chrono::steady_clock::now();
    port.close();
    writer.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    EXPECT_FALSE(port.is_open());
    EXPECT_NE(writer_error.find("closed"), std::string::npos) << writer_error;
}

TEST(SerialPort, RtsAfterCloseThrows) {
    PtyPair pty;
    SerialPort port(pty.slave_path());
    port.close();
    EXPECT_THROW(port.set_rts(true), std::runtime_error);
}
