#pragma once

#include <vector>
#include <string>
#include <stdint.h>
#include "response.hpp"

namespace vmc {

std::string bytes_to_hex(const std::vector<uint8_t>& data);
std::string byte_to_hex(uint8_t value);
std::string describe_fault(uint8_t code, int slot);
bool is_known_fault(uint8_t code);
std::string describe_response(const Response& response);

} // namespace vmc
