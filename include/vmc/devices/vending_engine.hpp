#pragma once

#include "transport/transport.hpp"
#include "transport/frame.hpp"
#include "devices/response_decoder.hpp"
#include "common/types.hpp"
#include "common/response.hpp"
#include "common/protocol.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <stdint.h>

namespace vmc {

struct EngineConfig
{
    int command_timeout_ms = Protocol::COMMAND_TIMEOUT_MS;
    int poll_interval_ms = Protocol::POLL_INTERVAL_MS;
    int max_poll_attempts = Protocol::MAX_POLL_ATTEMPTS;
};

class VendingEngine
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    explicit VendingEngine(Transport& transport, EngineConfig config = {});

    VendingEngine(const VendingEngine&) = delete;
    VendingEngine& operator=(const VendingEngine&) = delete;

    Result<bool> connect(const SerialConfig& config = {});
    void disconnect();
    bool is_connected() const { return transport_.is_connected(); }

    // One request/response exchange, serialized with every other exchange
    // on this engine.
    Result<Response> execute_command(const Frame& frame, StatusMode mode = StatusMode::STATUS);

    Result<std::string> get_device_id();
    Result<DeliveryResponse> send_delivery_command(int slot, int quantity = 1);
    Result<StatusResponse> query_delivery_status(int slot, int quantity = 1);
    Result<bool> clear_faults();
    Result<uint32_t> query_balance();
    Result<bool> payment_instruction(int64_t amount_cents, PaymentMethod method, int slot);
    Result<bool> coin_change();
    Result<bool> cashless_cancel();
    Result<bool> debit_instruction(int64_t amount_cents);
    Result<bool> age_recognition(int required_age);
    Result<bool> query_coin_change_status();
    Result<bool> query_age_verification();

    // Delivery followed by status polling. Never fails with an error, the
    // outcome is in the returned result. Clearing `running` stops polling.
    DispenseResult dispense_water(int slot);
    DispenseResult dispense_water(int slot, const std::atomic<bool>& running);

    const EngineConfig& config() const { return config_; }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    Transport& transport_;
    const EngineConfig config_;
    std::mutex line_mutex_;
    LogCallback log_callback_;

    void log(const std::string& msg);

    // Caller must hold line_mutex_.
    Result<Response> exchange(const Frame& frame, StatusMode mode);
    Result<Response> run(const Result<Frame>& frame, StatusMode mode = StatusMode::STATUS);

    Result<bool> run_simple(const Result<Frame>& frame);
    bool wait_poll_interval(const std::atomic<bool>& running);
};

} // namespace vmc
