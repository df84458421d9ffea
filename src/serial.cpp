#include "transport/serial.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <poll.h>
#include <errno.h>

#include <algorithm>
#include <chrono>

namespace vmc {

speed_t baud_to_speed(int baud)
{
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        default:     return B0;
    }
}

void SerialPort::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

bool SerialPort::apply_line_settings(termios& tty)
{
    speed_t speed = baud_to_speed(config_.baud);
    if (speed == B0) {
        last_error_ = "Unsupported baud rate " + std::to_string(config_.baud);
        return false;
    }

    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);
    cfmakeraw(&tty);

    tty.c_cflag &= ~CSIZE;
    switch (config_.data_bits) {
        case 5: tty.c_cflag |= CS5; break;
        case 6: tty.c_cflag |= CS6; break;
        case 7: tty.c_cflag |= CS7; break;
        default: tty.c_cflag |= CS8; break;
    }

    switch (config_.parity) {
        case SerialConfig::Parity::NONE:
            tty.c_cflag &= ~PARENB;
            break;
        case SerialConfig::Parity::ODD:
            tty.c_cflag |= PARENB | PARODD;
            break;
        case SerialConfig::Parity::EVEN:
            tty.c_cflag |= PARENB;
            tty.c_cflag &= ~PARODD;
            break;
    }

    if (config_.stop_bits == 2)
        tty.c_cflag |= CSTOPB;
    else
        tty.c_cflag &= ~CSTOPB;

    tty.c_cflag &= ~CRTSCTS;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);
    if (config_.flow_control == SerialConfig::FlowControl::HARDWARE)
        tty.c_cflag |= CRTSCTS;
    else if (config_.flow_control == SerialConfig::FlowControl::SOFTWARE)
        tty.c_iflag |= IXON | IXOFF;

    tty.c_cflag |= CREAD | CLOCAL;

    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    return true;
}

bool SerialPort::connect(const SerialConfig& config)
{
    if (fd_ >= 0) {
        return true;
    }

    config_ = config;

    fd_ = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY);
    if (fd_ < 0) {
        last_error_ = "Error opening " + config_.device + ": " + strerror(errno);
        log("[SERIAL] " + last_error_);
        return false;
    }

    if (tcgetattr(fd_, &original_tty_) != 0) {
        last_error_ = std::string("Error getting port attributes: ") + strerror(errno);
        log("[SERIAL] " + last_error_);
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    struct termios tty = original_tty_;
    if (!apply_line_settings(tty)) {
        log("[SERIAL] " + last_error_);
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        last_error_ = std::string("Error setting port attributes: ") + strerror(errno);
        log("[SERIAL] " + last_error_);
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    tcflush(fd_, TCIOFLUSH);
    log("[SERIAL] Opened " + config_.device + " at " + std::to_string(config_.baud) + " baud");
    return true;
}

void SerialPort::disconnect()
{
    if (fd_ >= 0) {
        tcsetattr(fd_, TCSANOW, &original_tty_);
        ::close(fd_);
        fd_ = -1;
        log("[SERIAL] Closed " + config_.device);
    }
}

bool SerialPort::send(const std::vector<uint8_t>& data)
{
    if (fd_ < 0) {
        last_error_ = "Not connected";
        return false;
    }

    size_t total = 0;
    while (total < data.size()) {
        ssize_t written = ::write(fd_, data.data() + total, data.size() - total);
        if (written < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("Write failed: ") + strerror(errno);
            log("[SERIAL] " + last_error_);
            return false;
        }
        total += static_cast<size_t>(written);
    }

    tcdrain(fd_);
    return true;
}

// Collects bytes until the line has been quiet for gap_ms_ after the first
// byte, a maximum size frame has arrived, or timeout_ms has passed.
std::optional<std::vector<uint8_t>> SerialPort::receive(int timeout_ms)
{
    if (fd_ < 0) {
        last_error_ = "Not connected";
        return std::nullopt;
    }

    constexpr size_t MAX_FRAME = Protocol::MIN_FRAME_SIZE + Protocol::MAX_PAYLOAD;
    constexpr int SLICE_MS = 10;

    std::vector<uint8_t> buffer;
    unsigned char temp[256];
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + std::chrono::milliseconds(timeout_ms);
    auto last_data = start;

    while (std::chrono::steady_clock::now() < deadline && buffer.size() < MAX_FRAME)
    {
        struct pollfd pfd = {fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, SLICE_MS);

        if (ret > 0) {
            size_t room = std::min(sizeof(temp), MAX_FRAME - buffer.size());
            ssize_t n = ::read(fd_, temp, room);
            if (n > 0) {
                std::vector<uint8_t> chunk(temp, temp + n);
                if (data_callback_) {
                    data_callback_(chunk);
                }
                buffer.insert(buffer.end(), chunk.begin(), chunk.end());
                last_data = std::chrono::steady_clock::now();
            }
        }
        else if (ret < 0 && errno != EINTR) {
            last_error_ = std::string("Poll failed: ") + strerror(errno);
            log("[SERIAL] " + last_error_);
            break;
        }

        if (!buffer.empty() &&
            std::chrono::steady_clock::now() - last_data >= std::chrono::milliseconds(gap_ms_))
            break;
    }

    if (buffer.empty()) {
        return std::nullopt;
    }
    return buffer;
}

void SerialPort::clear_buffers()
{
    if (fd_ >= 0) {
        tcflush(fd_, TCIOFLUSH);
    }
}

} // namespace vmc
