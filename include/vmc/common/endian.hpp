#pragma once
#include <cstdint>
#include <bit>
#include <cstring>

namespace vmc {

// Amounts on the wire are little-endian 32-bit.
constexpr uint32_t to_little_endian_32(uint32_t val) {
    if constexpr (std::endian::native == std::endian::little) {
        return val;
    } else {
        return std::byteswap(val);
    }
}

constexpr uint32_t from_little_endian_32(uint32_t val) {
    return to_little_endian_32(val);
}

inline void write_le32(uint8_t* buf, uint32_t val) {
    uint32_t le_val = to_little_endian_32(val);
    std::memcpy(buf, &le_val, sizeof(le_val));
}

inline uint32_t read_le32(const uint8_t* buf) {
    uint32_t temp;
    std::memcpy(&temp, buf, sizeof(temp));
    return from_little_endian_32(temp);
}

} // namespace vmc
