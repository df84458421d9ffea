#pragma once

#include <string>
#include <cstring>
#include <vector>
#include <termios.h>

#include "transport/transport.hpp"
#include "common/protocol.hpp"

namespace vmc {

class SerialPort : public Transport
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    SerialPort() = default;
    ~SerialPort() override
    {
        disconnect();
    }

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    bool connect(const SerialConfig& config) override;
    void disconnect() override;
    bool is_connected() const override { return fd_ >= 0; }

    bool send(const std::vector<uint8_t>& data) override;
    std::optional<std::vector<uint8_t>> receive(int timeout_ms) override;

    void set_data_callback(DataCallback callback) override { data_callback_ = std::move(callback); }
    void clear_buffers() override;

    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }
    void set_inter_byte_gap_ms(int gap_ms) { gap_ms_ = gap_ms; }

    std::string get_port() const { return config_.device; }
    int get_baud() const { return config_.baud; }
    std::string get_last_error() const { return last_error_; }

private:
    int fd_ = -1;
    SerialConfig config_;
    struct termios original_tty_{};
    int gap_ms_ = Protocol::INTER_BYTE_GAP_MS;
    std::string last_error_;
    DataCallback data_callback_;
    LogCallback log_callback_;

    void log(const std::string& msg);
    bool apply_line_settings(termios& tty);
};

speed_t baud_to_speed(int baud);

} // namespace vmc
