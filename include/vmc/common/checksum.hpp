#pragma once
#include <stdint.h>
#include <cstddef>

namespace vmc {

// Additive checksum over HEADER, CMD, LEN and DATA, truncated to one byte.
class Checksum
{
public:
    static uint8_t calculate(const uint8_t* data, size_t len, uint8_t seed = 0)
    {
        unsigned int sum = seed;
        for (size_t i = 0; i < len; i++)
            sum += data[i];
        return static_cast<uint8_t>(sum & 0xFF);
    }
};

} // namespace vmc
