#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace r3dact::utils {

// offset and byte formatting
std::string format_offset(uint64_t offset);
std::string format_bytes(const std::vector<uint8_t>& bytes);

// printable rendering of raw bytes, non-printables as \xNN
std::string format_escaped(const std::vector<uint8_t>& bytes);

// hex digit utilities
bool is_hex_digit(char c);
uint8_t parse_hex_digit(char c);
std::string to_hex_string(uint8_t byte);

} // namespace r3dact::utils
