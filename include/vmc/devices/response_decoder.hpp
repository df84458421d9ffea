#pragma once

#include "transport/frame.hpp"
#include "common/response.hpp"

namespace vmc {

// query-status and query-balance share command 0xE1; the caller says which
// one it asked for.
enum class StatusMode
{
    STATUS,
    BALANCE
};

class ResponseDecoder
{
public:
    static Response decode(const Frame& frame, StatusMode mode = StatusMode::STATUS);

private:
    static Response decode_status(const std::vector<uint8_t>& payload);
    static Response decode_balance(const std::vector<uint8_t>& payload);
    static bool success_byte(const std::vector<uint8_t>& payload);
};

} // namespace vmc
