#pragma once

#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace r3dact::engine {

// how a pattern was written by the caller
enum class pattern_notation { literal, hex };

// literal byte pattern; no wildcards or metacharacters
struct pattern {
  std::vector<uint8_t> bytes;
  std::string source;
  pattern_notation notation = pattern_notation::literal;

  size_t size() const noexcept { return bytes.size(); }
  bool empty() const noexcept { return bytes.empty(); }
};

// utf-8 text taken byte for byte; invalid_encoding if the text is not well-formed utf-8
result<pattern> parse_literal(std::string_view text);

// hex byte string such as "68 75 6e" or "68756e"; invalid_pattern on bad digits or wildcards
result<pattern> parse_hex(std::string_view hex);

// compiles inputs in order, stopping at the first failure
result<std::vector<pattern>> compile_patterns(const std::vector<std::string>& inputs, pattern_notation notation);

// printable form used in console output and logs
std::string describe_pattern(const pattern& pat);

} // namespace r3dact::engine
