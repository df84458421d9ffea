#include "devices/commands.hpp"
#include "common/endian.hpp"

#include <limits>
#include <string>

namespace vmc {

namespace {

bool in_byte_range(int value)
{
    return value >= 1 && value <= 255;
}

bool valid_amount(int64_t amount)
{
    return amount >= 0 && amount <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max());
}

std::vector<uint8_t> le32_bytes(uint32_t value)
{
    std::vector<uint8_t> bytes(4);
    write_le32(bytes.data(), value);
    return bytes;
}

} // anonymous namespace

Result<Frame> CommandBuilder::host_frame(uint8_t command, std::vector<uint8_t> payload)
{
    return FrameCodec::make(Header::HOST, command, std::move(payload));
}

Result<Frame> CommandBuilder::get_device_id()
{
    return host_frame(Protocol::Command::GET_DEVICE_ID, {Protocol::Marker::DEVICE_ID});
}

Result<Frame> CommandBuilder::deliver(int slot, int quantity)
{
    if (!in_byte_range(slot)) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "slot must be between 1 and 255, got " + std::to_string(slot));
    }
    if (!in_byte_range(quantity)) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "quantity must be between 1 and 255, got " + std::to_string(quantity));
    }
    return host_frame(Protocol::Command::DELIVER,
        {static_cast<uint8_t>(slot), static_cast<uint8_t>(quantity)});
}

Result<Frame> CommandBuilder::remove_fault()
{
    return host_frame(Protocol::Command::REMOVE_FAULT, {Protocol::Marker::BROADCAST});
}

Result<Frame> CommandBuilder::query_status(int slot, int quantity)
{
    if (!in_byte_range(slot)) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "slot must be between 1 and 255, got " + std::to_string(slot));
    }
    if (!in_byte_range(quantity)) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "quantity must be between 1 and 255, got " + std::to_string(quantity));
    }
    return host_frame(Protocol::Command::QUERY_STATUS,
        {static_cast<uint8_t>(slot), static_cast<uint8_t>(quantity)});
}

Result<Frame> CommandBuilder::query_balance()
{
    return host_frame(Protocol::Command::QUERY_BALANCE, {0x00, 0x00, 0x00, 0x00});
}

Result<Frame> CommandBuilder::payment_instruction(int64_t amount_cents, PaymentMethod method, int slot)
{
    if (!valid_amount(amount_cents)) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "amount must be a non-negative 32-bit value, got " + std::to_string(amount_cents));
    }
    if (slot < 0 || slot > 255) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "slot must fit in one byte, got " + std::to_string(slot));
    }

    std::vector<uint8_t> payload = le32_bytes(static_cast<uint32_t>(amount_cents));
    payload.push_back(static_cast<uint8_t>(method));
    payload.push_back(static_cast<uint8_t>(slot));
    return host_frame(Protocol::Command::PAYMENT_INSTRUCTION, std::move(payload));
}

Result<Frame> CommandBuilder::coin_change()
{
    return host_frame(Protocol::Command::COIN_CHANGE, {Protocol::Marker::BROADCAST});
}

Result<Frame> CommandBuilder::cashless_cancel()
{
    return host_frame(Protocol::Command::CASHLESS_CANCEL, {Protocol::Marker::BROADCAST});
}

Result<Frame> CommandBuilder::debit_instruction(int64_t amount_cents)
{
    if (!valid_amount(amount_cents)) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "amount must be a non-negative 32-bit value, got " + std::to_string(amount_cents));
    }
    return host_frame(Protocol::Command::DEBIT_INSTRUCTION,
        le32_bytes(static_cast<uint32_t>(amount_cents)));
}

Result<Frame> CommandBuilder::age_recognition(int required_age)
{
    if (required_age <= 0 || required_age >= 100) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "required age must be between 1 and 99, got " + std::to_string(required_age));
    }
    return host_frame(Protocol::Command::AGE_RECOGNITION, {static_cast<uint8_t>(required_age)});
}

Result<Frame> CommandBuilder::query_coin_change_status()
{
    return host_frame(Protocol::Command::QUERY_COIN_CHANGE_STATUS, {Protocol::Marker::QUERY});
}

Result<Frame> CommandBuilder::query_age_verification()
{
    return host_frame(Protocol::Command::QUERY_AGE_VERIFICATION, {Protocol::Marker::QUERY});
}

} // namespace vmc
