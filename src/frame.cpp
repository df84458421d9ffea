#include "transport/frame.hpp"
#include "common/checksum.hpp"

#include <string>

namespace vmc {

uint8_t FrameCodec::checksum(Header header, uint8_t command, const std::vector<uint8_t>& payload)
{
    uint8_t head[] = {
        static_cast<uint8_t>(header),
        command,
        static_cast<uint8_t>(payload.size())
    };
    uint8_t sum = Checksum::calculate(head, sizeof(head));
    return Checksum::calculate(payload.data(), payload.size(), sum);
}

Result<Frame> FrameCodec::make(Header header, uint8_t command, std::vector<uint8_t> payload)
{
    if (payload.size() > Protocol::MAX_PAYLOAD) {
        return Result<Frame>::failure(Error::ARGUMENT,
            "payload of " + std::to_string(payload.size()) + " bytes exceeds 255");
    }

    Frame frame;
    frame.header = header;
    frame.command = command;
    frame.checksum = checksum(header, command, payload);
    frame.payload = std::move(payload);
    return Result<Frame>::success(std::move(frame));
}

std::vector<uint8_t> FrameCodec::encode(const Frame& frame)
{
    std::vector<uint8_t> bytes;
    bytes.reserve(Protocol::MIN_FRAME_SIZE + frame.payload.size());

    bytes.push_back(frame.address);
    bytes.push_back(frame.sequence);
    bytes.push_back(static_cast<uint8_t>(frame.header));
    bytes.push_back(frame.command);
    bytes.push_back(frame.length());
    bytes.insert(bytes.end(), frame.payload.begin(), frame.payload.end());
    bytes.push_back(frame.checksum);

    return bytes;
}

Result<std::vector<uint8_t>> FrameCodec::encode(Header header, uint8_t command, const std::vector<uint8_t>& payload)
{
    auto frame = make(header, command, payload);
    if (!frame.ok()) {
        return Result<std::vector<uint8_t>>::failure(frame.failure_info());
    }
    return Result<std::vector<uint8_t>>::success(encode(frame.value()));
}

Result<Frame> FrameCodec::decode(const uint8_t* data, size_t len)
{
    // ADDR + SEQ + HEADER + CMD + LEN + CHK = 6 bytes min
    if (len < Protocol::MIN_FRAME_SIZE) {
        return Result<Frame>::failure(Error::PROTOCOL,
            "frame too short (" + std::to_string(len) + " bytes)");
    }

    if (data[0] != Protocol::ADDRESS || data[1] != Protocol::SEQUENCE) {
        return Result<Frame>::failure(Error::PROTOCOL, "bad frame address");
    }

    size_t declared = data[4];
    if (len - Protocol::MIN_FRAME_SIZE != declared) {
        return Result<Frame>::failure(Error::PROTOCOL,
            "length mismatch: declared " + std::to_string(declared) +
            ", received " + std::to_string(len - Protocol::MIN_FRAME_SIZE));
    }

    Frame frame;
    frame.address = data[0];
    frame.sequence = data[1];
    frame.header = static_cast<Header>(data[2]);
    frame.command = data[3];
    frame.payload.assign(data + 5, data + 5 + declared);
    frame.checksum = data[len - 1];

    // checksum covers HEADER, CMD, LEN and DATA; header value is checked by the caller
    uint8_t calculated = Checksum::calculate(data + 2, len - 3);
    if (calculated != frame.checksum) {
        return Result<Frame>::failure(Error::PROTOCOL, "checksum mismatch");
    }

    return Result<Frame>::success(std::move(frame));
}

} // namespace vmc
