#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace r3dact::utils {

// hex byte strings: pairs of hex digits, whitespace ignored, comments stripped
bool is_valid_hex_pattern(const std::string& pattern);
bool has_hex_wildcards(const std::string& pattern);
std::vector<uint8_t> parse_hex_pattern(const std::string& hex);
std::string normalize_hex_pattern(const std::string& pattern);

} // namespace r3dact::utils
