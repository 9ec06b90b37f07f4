#include "ymodem/serial_port.hpp"
#include "ymodem/log.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/ioctl.h>
#include <string>
#include <system_error>
#include <termios.h>
#include <unistd.h>
#include <utility>

namespace ymodem {

namespace {

speed_t to_speed(uint32_t baud) {
    switch (baud) {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 460800: return B460800;
    case 921600: return B921600;
    default: break;
    }
    throw std::invalid_argument("Unsupported baud rate: " + std::to_string(baud));
}

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

SerialPort::SerialPort(const std::string& device, const SerialConfig& config)
    : device_(device), config_(config) {
    const speed_t speed = to_speed(config.baud_rate);

    fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        throw_errno("Failed to open serial device: " + device);
    }

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::system_error(err, std::generic_category(), "tcgetattr failed: " + device);
    }
    // Raw 8N1, no flow control, no echo or line discipline
    ::cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);
    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::system_error(err, std::generic_category(), "tcsetattr failed: " + device);
    }

    if (config.settle_delay.count() > 0) {
        std::this_thread::sleep_for(config.settle_delay);
    }
    // drop whatever the board printed while booting
    ::tcflush(fd_, TCIFLUSH);

    running_ = true;
    reader_ = std::thread([this] { reader_loop(); });
}

SerialPort::~SerialPort() {
    close();
}

void SerialPort::close() {
    // cleared before taking write_mutex_ so a stalled write() gives it up
    running_ = false;
    if (reader_.joinable()) {
        reader_.join();
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SerialPort::write(std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (fd_ < 0) {
        throw std::runtime_error("Serial port is closed: " + device_);
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.write_timeout;
    std::size_t done = 0;
    while (done < data.size()) {
        if (!running_) {
            throw std::runtime_error("Serial port is closed: " + device_);
        }
        const ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
        if (n > 0) {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
            // output queue full; wait for the driver to drain
            if (std::chrono::steady_clock::now() >= deadline) {
                throw std::system_error(ETIMEDOUT, std::generic_category(),
                                        "Write stalled on " + device_ + " (" + std::to_string(done) + "/" +
                                            std::to_string(data.size()) + " bytes queued)");
            }
            pollfd pfd{fd_, POLLOUT, 0};
            if (::poll(&pfd, 1, static_cast<int>(config_.poll_interval.count())) < 0 && errno != EINTR) {
                throw_errno("poll failed on " + device_);
            }
            continue;
        }
        throw_errno("Write failed on " + device_);
    }
}

ITransport::SubscriptionId SerialPort::subscribe(ChunkHandler handler) {
    return dispatcher_.add(std::move(handler));
}

void SerialPort::unsubscribe(SubscriptionId id) {
    dispatcher_.remove(id);
}

void SerialPort::set_rts(bool asserted) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (fd_ < 0) {
        throw std::runtime_error("Serial port is closed: " + device_);
    }
    int flag = TIOCM_RTS;
    if (::ioctl(fd_, asserted ? TIOCMBIS : TIOCMBIC, &flag) != 0) {
        throw_errno("Failed to set RTS on " + device_);
    }
}

void SerialPort::pulse_rts(std::chrono::milliseconds width) {
    set_rts(true);
    std::this_thread::sleep_for(width);
    set_rts(false);
}

void SerialPort::reader_loop() {
    uint8_t buf[512];
    const int timeout_ms = static_cast<int>(config_.poll_interval.count());
    while (running_) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            YMODEM_DEBUGF("poll failed on %s: errno=%d", device_.c_str(), errno);
            break;
        }
        if (ready == 0) {
            continue;
        }
        if (pfd.revents & (POLLERR | POLLNVAL)) {
            YMODEM_DEBUGF("%s: device error (revents=0x%x), reader stopped", device_.c_str(), pfd.revents);
            break;
        }
        const ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            dispatcher_.dispatch(std::span<const uint8_t>(buf, static_cast<std::size_t>(n)));
        } else if (n == 0 || (pfd.revents & POLLHUP)) {
            // unplugged or other end closed; waits will now time out
            YMODEM_DEBUGF("%s: hang-up, reader stopped", device_.c_str());
            break;
        } else if (errno != EAGAIN && errno != EINTR) {
            YMODEM_DEBUGF("read failed on %s: errno=%d", device_.c_str(), errno);
            break;
        }
    }
}

} // namespace ymodem
