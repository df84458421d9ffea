#include "common/helpers.hpp"
#include "common/protocol.hpp"
#include "common/types.hpp"
#include <sstream>
#include <iomanip>
#include <type_traits>

namespace vmc {

const char* error_name(Error error)
{
    switch (error) {
        case Error::ARGUMENT:       return "ARGUMENT";
        case Error::CONNECTION:     return "CONNECTION";
        case Error::PROTOCOL:       return "PROTOCOL";
        case Error::TIMEOUT:        return "TIMEOUT";
        case Error::HARDWARE_FAULT: return "HARDWARE_FAULT";
    }
    return "?";
}

std::string bytes_to_hex(const std::vector<uint8_t>& data)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < data.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string byte_to_hex(uint8_t value)
{
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setfill('0')
        << std::setw(2) << static_cast<int>(value);
    return oss.str();
}

bool is_known_fault(uint8_t code)
{
    return code == Protocol::Fault::MOTOR_FAILURE
        || code == Protocol::Fault::OPTICAL_EYE_FAILURE;
}

std::string describe_fault(uint8_t code, int slot)
{
    switch (code) {
        case Protocol::Fault::MOTOR_FAILURE:
            return "Motor failure in slot " + std::to_string(slot);
        case Protocol::Fault::OPTICAL_EYE_FAILURE:
            return "Optical sensor failure in slot " + std::to_string(slot);
        default:
            return "Unknown fault " + byte_to_hex(code) + " in slot " + std::to_string(slot);
    }
}

std::string describe_response(const Response& response)
{
    return std::visit([](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, DeviceIdResponse>) {
            return "DeviceId(" + r.device_id + ")";
        } else if constexpr (std::is_same_v<T, DeliveryResponse>) {
            return "Delivery(slot=" + std::to_string(r.slot) + ", qty=" + std::to_string(r.quantity) + ")";
        } else if constexpr (std::is_same_v<T, StatusResponse>) {
            std::string s = r.success ? "Status(success" : "Status(failure";
            if (r.error_code) s += ", code=" + byte_to_hex(*r.error_code);
            if (r.amount) s += ", amount=" + std::to_string(*r.amount);
            return s + ")";
        } else if constexpr (std::is_same_v<T, BalanceResponse>) {
            return "Balance(" + std::to_string(r.amount) + ")";
        } else if constexpr (std::is_same_v<T, PaymentResponse>) {
            return std::string("Payment(") + (r.success ? "ok" : "rejected") + ")";
        } else if constexpr (std::is_same_v<T, SimpleResponse>) {
            return std::string("Simple(") + (r.success ? "ok" : "rejected") + ")";
        } else if constexpr (std::is_same_v<T, CoinChangeStatusResponse>) {
            return std::string("CoinChange(") + (r.can_refund ? "can refund" : "insufficient") + ")";
        } else if constexpr (std::is_same_v<T, AgeVerificationResponse>) {
            return std::string("AgeVerification(") + (r.verified ? "verified" : "not verified") + ")";
        } else {
            return "Error(" + r.message + ")";
        }
    }, response);
}

} // namespace vmc
