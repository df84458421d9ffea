#pragma once

#include <vector>
#include <stdint.h>

#include "common/types.hpp"
#include "common/protocol.hpp"

namespace vmc {

enum class Header : uint8_t
{
    HOST = Protocol::HOST_HEADER,
    DEVICE = Protocol::DEVICE_HEADER
};

// [ADDR][SEQ][HEADER][CMD][LEN][DATA...][CHK]
struct Frame
{
    uint8_t address = Protocol::ADDRESS;
    uint8_t sequence = Protocol::SEQUENCE;
    Header header = Header::HOST;
    uint8_t command = 0;
    std::vector<uint8_t> payload;
    uint8_t checksum = 0;

    uint8_t length() const { return static_cast<uint8_t>(payload.size()); }
};

class FrameCodec
{
public:
    static Result<Frame> make(Header header, uint8_t command, std::vector<uint8_t> payload);

    static std::vector<uint8_t> encode(const Frame& frame);
    static Result<std::vector<uint8_t>> encode(Header header, uint8_t command, const std::vector<uint8_t>& payload);
    static Result<Frame> decode(const uint8_t* data, size_t len);
    static Result<Frame> decode(const std::vector<uint8_t>& bytes)
    {
        return decode(bytes.data(), bytes.size());
    }

    static uint8_t checksum(Header header, uint8_t command, const std::vector<uint8_t>& payload);
};

} // namespace vmc
