#include "devices/vending_engine.hpp"
#include "devices/commands.hpp"
#include "devices/slot_layout.hpp"
#include "common/helpers.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

namespace vmc {

namespace {

constexpr int SLEEP_SLICE_MS = 10;

// Narrows a decoded response to the kind the request asked for.
template<typename T>
Result<T> expect(const Result<Response>& result)
{
    if (!result.ok()) {
        return Result<T>::failure(result.failure_info());
    }
    if (const auto* error = std::get_if<ErrorResponse>(&result.value())) {
        return Result<T>::failure(Error::PROTOCOL, error->message);
    }
    if (const auto* value = std::get_if<T>(&result.value())) {
        return Result<T>::success(*value);
    }
    return Result<T>::failure(Error::PROTOCOL,
        "unexpected response type " + describe_response(result.value()));
}

long long elapsed_since(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

VendingEngine::VendingEngine(Transport& transport, EngineConfig config)
    : transport_(transport), config_(config) {}

void VendingEngine::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Result<bool> VendingEngine::connect(const SerialConfig& config)
{
    std::lock_guard<std::mutex> lock(line_mutex_);

    if (!transport_.connect(config)) {
        log("[VMC] Failed to connect to " + config.device);
        return Result<bool>::failure(Error::CONNECTION, "failed to connect to " + config.device);
    }
    log("[VMC] Connected to " + config.device);
    return Result<bool>::success(true);
}

void VendingEngine::disconnect()
{
    std::lock_guard<std::mutex> lock(line_mutex_);
    transport_.disconnect();
    log("[VMC] Disconnected");
}

Result<Response> VendingEngine::exchange(const Frame& frame, StatusMode mode)
{
    if (!transport_.is_connected()) {
        return Result<Response>::failure(Error::CONNECTION, "not connected to VMC");
    }

    std::vector<uint8_t> request = FrameCodec::encode(frame);

    // Drop anything left over from an earlier exchange that timed out
    transport_.clear_buffers();

    bool sent = false;
    try {
        sent = transport_.send(request);
    } catch (const std::exception& e) {
        log(std::string("[VMC] Send threw: ") + e.what());
        return Result<Response>::failure(Error::PROTOCOL, std::string("send failed: ") + e.what());
    }
    if (!sent) {
        log("[VMC] Send failed for " + byte_to_hex(frame.command));
        return Result<Response>::failure(Error::PROTOCOL, "send failed");
    }
    log("[VMC] TX " + bytes_to_hex(request));

    auto reply = transport_.receive(config_.command_timeout_ms);
    if (!reply) {
        log("[VMC] No response to " + byte_to_hex(frame.command) + " within " +
            std::to_string(config_.command_timeout_ms) + "ms");
        return Result<Response>::failure(Error::TIMEOUT,
            "no response within " + std::to_string(config_.command_timeout_ms) + "ms");
    }
    log("[VMC] RX " + bytes_to_hex(*reply));

    auto decoded = FrameCodec::decode(*reply);
    if (!decoded.ok()) {
        return Result<Response>::failure(Error::PROTOCOL, "invalid response frame: " + decoded.message());
    }

    const Frame& response = decoded.value();
    if (response.header != Header::DEVICE) {
        return Result<Response>::failure(Error::PROTOCOL,
            "invalid response header " + byte_to_hex(static_cast<uint8_t>(response.header)));
    }
    if (response.command != frame.command) {
        return Result<Response>::failure(Error::PROTOCOL,
            "unexpected response command: expected " + byte_to_hex(frame.command) +
            ", got " + byte_to_hex(response.command));
    }

    return Result<Response>::success(ResponseDecoder::decode(response, mode));
}

Result<Response> VendingEngine::execute_command(const Frame& frame, StatusMode mode)
{
    std::lock_guard<std::mutex> lock(line_mutex_);
    return exchange(frame, mode);
}

Result<Response> VendingEngine::run(const Result<Frame>& frame, StatusMode mode)
{
    if (!frame.ok()) {
        return Result<Response>::failure(frame.failure_info());
    }
    return execute_command(frame.value(), mode);
}

Result<bool> VendingEngine::run_simple(const Result<Frame>& frame)
{
    auto result = expect<SimpleResponse>(run(frame));
    if (!result.ok()) {
        return Result<bool>::failure(result.failure_info());
    }
    return Result<bool>::success(result.value().success);
}

Result<std::string> VendingEngine::get_device_id()
{
    auto result = expect<DeviceIdResponse>(run(CommandBuilder::get_device_id()));
    if (!result.ok()) {
        return Result<std::string>::failure(result.failure_info());
    }
    return Result<std::string>::success(result.value().device_id);
}

Result<DeliveryResponse> VendingEngine::send_delivery_command(int slot, int quantity)
{
    return expect<DeliveryResponse>(run(CommandBuilder::deliver(slot, quantity)));
}

Result<StatusResponse> VendingEngine::query_delivery_status(int slot, int quantity)
{
    auto result = expect<StatusResponse>(run(CommandBuilder::query_status(slot, quantity)));
    if (!result.ok()) {
        return result;
    }

    const auto& status = result.value();
    if (!status.success && status.error_code) {
        return Result<StatusResponse>::fault(*status.error_code, describe_fault(*status.error_code, slot));
    }
    return result;
}

Result<bool> VendingEngine::clear_faults()
{
    return run_simple(CommandBuilder::remove_fault());
}

Result<uint32_t> VendingEngine::query_balance()
{
    auto result = expect<BalanceResponse>(run(CommandBuilder::query_balance(), StatusMode::BALANCE));
    if (!result.ok()) {
        return Result<uint32_t>::failure(result.failure_info());
    }
    return Result<uint32_t>::success(result.value().amount);
}

Result<bool> VendingEngine::payment_instruction(int64_t amount_cents, PaymentMethod method, int slot)
{
    auto result = expect<PaymentResponse>(run(CommandBuilder::payment_instruction(amount_cents, method, slot)));
    if (!result.ok()) {
        return Result<bool>::failure(result.failure_info());
    }
    return Result<bool>::success(result.value().success);
}

Result<bool> VendingEngine::coin_change()
{
    return run_simple(CommandBuilder::coin_change());
}

Result<bool> VendingEngine::cashless_cancel()
{
    return run_simple(CommandBuilder::cashless_cancel());
}

Result<bool> VendingEngine::debit_instruction(int64_t amount_cents)
{
    return run_simple(CommandBuilder::debit_instruction(amount_cents));
}

Result<bool> VendingEngine::age_recognition(int required_age)
{
    return run_simple(CommandBuilder::age_recognition(required_age));
}

Result<bool> VendingEngine::query_coin_change_status()
{
    auto result = expect<CoinChangeStatusResponse>(run(CommandBuilder::query_coin_change_status()));
    if (!result.ok()) {
        return Result<bool>::failure(result.failure_info());
    }
    return Result<bool>::success(result.value().can_refund);
}

Result<bool> VendingEngine::query_age_verification()
{
    auto result = expect<AgeVerificationResponse>(run(CommandBuilder::query_age_verification()));
    if (!result.ok()) {
        return Result<bool>::failure(result.failure_info());
    }
    return Result<bool>::success(result.value().verified);
}

bool VendingEngine::wait_poll_interval(const std::atomic<bool>& running)
{
    int remaining = config_.poll_interval_ms;
    while (remaining > 0) {
        if (!running.load()) {
            return false;
        }
        int slice = std::min(remaining, SLEEP_SLICE_MS);
        std::this_thread::sleep_for(std::chrono::milliseconds(slice));
        remaining -= slice;
    }
    return running.load();
}

DispenseResult VendingEngine::dispense_water(int slot)
{
    std::atomic<bool> running{true};
    return dispense_water(slot, running);
}

DispenseResult VendingEngine::dispense_water(int slot, const std::atomic<bool>& running)
{
    const auto start = std::chrono::steady_clock::now();

    DispenseResult result;
    result.slot = slot;

    auto fail = [&](std::string message) {
        log("[VMC] Dispense slot " + std::to_string(slot) + " failed: " + message);
        result.success = false;
        result.error_message = std::move(message);
        result.elapsed_ms = elapsed_since(start);
        return result;
    };

    if (!SlotLayout::is_valid_slot(slot)) {
        return fail("Invalid slot number " + std::to_string(slot) + ". " + SlotLayout::describe_valid_slots());
    }

    // The whole dispense owns the line; other callers queue behind it.
    std::lock_guard<std::mutex> lock(line_mutex_);

    if (!running.load()) {
        return fail("Dispensing cancelled");
    }

    // Sending
    auto deliver_frame = CommandBuilder::deliver(slot, 1);
    if (!deliver_frame.ok()) {
        return fail("Failed to send delivery command: " + deliver_frame.message());
    }
    auto delivery = expect<DeliveryResponse>(exchange(deliver_frame.value(), StatusMode::STATUS));
    if (!delivery.ok()) {
        return fail("Failed to send delivery command: " + delivery.message());
    }
    if (delivery.value().slot != slot) {
        log("[VMC] Delivery echo reports slot " + std::to_string(delivery.value().slot) +
            ", requested " + std::to_string(slot));
    }

    // Polling
    auto status_frame = CommandBuilder::query_status(slot, 1);
    if (!status_frame.ok()) {
        return fail("Failed to build status query: " + status_frame.message());
    }

    for (int attempt = 1; attempt <= config_.max_poll_attempts; ++attempt) {
        if (!wait_poll_interval(running)) {
            return fail("Dispensing cancelled after " + std::to_string(attempt - 1) + " status polls");
        }

        auto status = expect<StatusResponse>(exchange(status_frame.value(), StatusMode::STATUS));
        if (!status.ok()) {
            if (status.error() == Error::CONNECTION) {
                return fail("Connection lost while polling: " + status.message());
            }
            log("[VMC] Status poll " + std::to_string(attempt) + " failed: " + status.message());
            continue;
        }

        const auto& s = status.value();
        if (s.success) {
            result.success = true;
            result.elapsed_ms = elapsed_since(start);
            log("[VMC] Dispensed slot " + std::to_string(slot) + " in " +
                std::to_string(result.elapsed_ms) + "ms");
            return result;
        }

        if (s.error_code) {
            if (!is_known_fault(*s.error_code)) {
                log("[VMC] Unrecognized status code " + byte_to_hex(*s.error_code) +
                    " for slot " + std::to_string(slot));
            }
            result.error_code = s.error_code;
            return fail(describe_fault(*s.error_code, slot));
        }
    }

    return fail("Dispensing operation timed out after " + std::to_string(config_.max_poll_attempts) +
        " status polls (" + std::to_string(elapsed_since(start)) + "ms)");
}

} // namespace vmc
