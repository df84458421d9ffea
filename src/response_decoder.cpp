#include "devices/response_decoder.hpp"
#include "common/endian.hpp"
#include "common/helpers.hpp"
#include "common/protocol.hpp"

namespace vmc {

bool ResponseDecoder::success_byte(const std::vector<uint8_t>& payload)
{
    return !payload.empty() && payload[0] == Protocol::Fault::SUCCESS;
}

Response ResponseDecoder::decode_status(const std::vector<uint8_t>& payload)
{
    if (payload.size() == 1) {
        StatusResponse status;
        if (payload[0] == Protocol::Fault::SUCCESS) {
            status.success = true;
        } else {
            status.error_code = payload[0];
        }
        return status;
    }

    // payment completed: 4-byte amount
    if (payload.size() == 4) {
        StatusResponse status;
        status.success = true;
        status.amount = read_le32(payload.data());
        return status;
    }

    return ErrorResponse{"invalid status response length " + std::to_string(payload.size())};
}

Response ResponseDecoder::decode_balance(const std::vector<uint8_t>& payload)
{
    if (payload.size() != 4) {
        return ErrorResponse{"invalid balance response length " + std::to_string(payload.size())};
    }
    return BalanceResponse{read_le32(payload.data())};
}

Response ResponseDecoder::decode(const Frame& frame, StatusMode mode)
{
    const auto& payload = frame.payload;

    switch (frame.command) {
        case Protocol::Command::GET_DEVICE_ID:
            if (payload.size() != Protocol::DEVICE_ID_LENGTH) {
                return ErrorResponse{"invalid device id length " + std::to_string(payload.size())};
            }
            return DeviceIdResponse{std::string(payload.begin(), payload.end())};

        case Protocol::Command::DELIVER:
            if (payload.size() != 2) {
                return ErrorResponse{"invalid delivery response length " + std::to_string(payload.size())};
            }
            return DeliveryResponse{payload[0], payload[1]};

        case Protocol::Command::QUERY_STATUS:
            return mode == StatusMode::BALANCE ? decode_balance(payload) : decode_status(payload);

        case Protocol::Command::PAYMENT_INSTRUCTION:
            return PaymentResponse{success_byte(payload)};

        case Protocol::Command::REMOVE_FAULT:
        case Protocol::Command::COIN_CHANGE:
        case Protocol::Command::CASHLESS_CANCEL:
        case Protocol::Command::DEBIT_INSTRUCTION:
        case Protocol::Command::AGE_RECOGNITION:
            return SimpleResponse{success_byte(payload)};

        case Protocol::Command::QUERY_COIN_CHANGE_STATUS:
            if (payload.size() != 1) {
                return ErrorResponse{"invalid coin change status length " + std::to_string(payload.size())};
            }
            return CoinChangeStatusResponse{payload[0] == 0x00};

        case Protocol::Command::QUERY_AGE_VERIFICATION:
            if (payload.size() != 1) {
                return ErrorResponse{"invalid age verification length " + std::to_string(payload.size())};
            }
            return AgeVerificationResponse{payload[0] == 0x01};

        default:
            return ErrorResponse{"unknown command response " + byte_to_hex(frame.command)};
    }
}

} // namespace vmc
