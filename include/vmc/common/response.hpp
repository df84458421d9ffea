#pragma once

#include <stdint.h>
#include <optional>
#include <string>
#include <variant>

namespace vmc {

struct DeviceIdResponse
{
    std::string device_id;      // 15 bytes as sent by the VMC
};

struct DeliveryResponse
{
    uint8_t slot = 0;
    uint8_t quantity = 0;
};

struct StatusResponse
{
    bool success = false;
    std::optional<uint8_t> error_code;
    std::optional<uint32_t> amount;     // payment completed, amount * 100
};

struct BalanceResponse
{
    uint32_t amount = 0;
};

struct PaymentResponse
{
    bool success = false;
};

struct SimpleResponse
{
    bool success = false;
};

struct CoinChangeStatusResponse
{
    bool can_refund = false;
};

struct AgeVerificationResponse
{
    bool verified = false;
};

struct ErrorResponse
{
    std::string message;
};

using Response = std::variant<
    DeviceIdResponse,
    DeliveryResponse,
    StatusResponse,
    BalanceResponse,
    PaymentResponse,
    SimpleResponse,
    CoinChangeStatusResponse,
    AgeVerificationResponse,
    ErrorResponse>;

struct DispenseResult
{
    bool success = false;
    int slot = 0;
    std::optional<uint8_t> error_code;
    std::optional<std::string> error_message;
    long long elapsed_ms = 0;
};

} // namespace vmc
