#pragma once
#include <stdint.h>
#include <cstddef>

namespace vmc {

namespace Protocol
{
    // Timeouts (ms)
    constexpr int COMMAND_TIMEOUT_MS = 5000;
    constexpr int POLL_INTERVAL_MS = 500;
    constexpr int MAX_POLL_ATTEMPTS = 20;
    constexpr int INTER_BYTE_GAP_MS = 100;

    // Frame layout
    constexpr uint8_t ADDRESS = 0xFF;
    constexpr uint8_t SEQUENCE = 0x00;
    constexpr uint8_t HOST_HEADER = 0x55;
    constexpr uint8_t DEVICE_HEADER = 0xAA;
    constexpr size_t MIN_FRAME_SIZE = 6;    // ADDR SEQ HDR CMD LEN CHK
    constexpr size_t MAX_PAYLOAD = 255;

    namespace Command {
        constexpr uint8_t GET_DEVICE_ID = 0x31;
        constexpr uint8_t DELIVER = 0x41;
        constexpr uint8_t REMOVE_FAULT = 0xA2;
        constexpr uint8_t PAYMENT_INSTRUCTION = 0x11;
        constexpr uint8_t COIN_CHANGE = 0xB1;
        constexpr uint8_t CASHLESS_CANCEL = 0xB2;
        constexpr uint8_t DEBIT_INSTRUCTION = 0xB3;
        constexpr uint8_t AGE_RECOGNITION = 0x12;
        constexpr uint8_t QUERY_STATUS = 0xE1;
        constexpr uint8_t QUERY_BALANCE = 0xE1;  // shares the status code
        constexpr uint8_t QUERY_COIN_CHANGE_STATUS = 0x07;
        constexpr uint8_t QUERY_AGE_VERIFICATION = 0x06;
    }

    namespace Fault {
        constexpr uint8_t SUCCESS = 0x01;
        constexpr uint8_t MOTOR_FAILURE = 0x02;
        constexpr uint8_t OPTICAL_EYE_FAILURE = 0x03;
    }

    // Fixed request payload bytes
    namespace Marker {
        constexpr uint8_t DEVICE_ID = 0xAD;
        constexpr uint8_t BROADCAST = 0xFF;
        constexpr uint8_t QUERY = 0x01;
    }

    constexpr size_t DEVICE_ID_LENGTH = 15;
}

enum class PaymentMethod : uint8_t
{
    CANCEL = 0x00,
    COIN = 0x01,
    CASHLESS = 0x02,
    BILL_ACCEPTOR = 0x03
};

} // namespace vmc
