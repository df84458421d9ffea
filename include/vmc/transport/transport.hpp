#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <stdint.h>

namespace vmc {

struct SerialConfig
{
    enum class Parity { NONE, ODD, EVEN };
    enum class FlowControl { NONE, HARDWARE, SOFTWARE };

    std::string device = "/dev/ttyS0";
    int baud = 9600;
    int data_bits = 8;
    int stop_bits = 1;
    Parity parity = Parity::NONE;
    FlowControl flow_control = FlowControl::NONE;
};

// Byte-level link to the VMC. send() reports failure by returning false and
// receive() returns nullopt when nothing arrived within the timeout.
class Transport
{
public:
    using DataCallback = std::function<void(const std::vector<uint8_t>& chunk)>;

    virtual ~Transport() = default;

    virtual bool connect(const SerialConfig& config) = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual bool send(const std::vector<uint8_t>& data) = 0;
    virtual std::optional<std::vector<uint8_t>> receive(int timeout_ms) = 0;

    // Observer for every chunk that comes off the line
    virtual void set_data_callback(DataCallback callback) = 0;
    virtual void clear_buffers() = 0;
};

} // namespace vmc
