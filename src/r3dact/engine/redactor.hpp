#pragma once

#include "pattern.hpp"
#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace r3dact::engine {

// every redacted byte becomes this value
inline constexpr uint8_t filler_byte = 'x';

// replacements made for one pattern
struct pattern_hits {
  size_t pattern_index = 0;
  size_t pattern_size = 0;
  std::vector<size_t> offsets;

  size_t count() const noexcept { return offsets.size(); }
};

// outcome of redacting one buffer; hits are in pattern list order, empty patterns included with no offsets
struct redaction_summary {
  std::vector<pattern_hits> hits;
  size_t bytes_redacted = 0;

  size_t total_matches() const noexcept;
  bool matched() const noexcept { return total_matches() > 0; }
};

/**
 * @brief Redact patterns from a buffer in place.
 *
 * Patterns apply one after another. For each pattern every non-overlapping occurrence in the current buffer is
 * located left to right and overwritten with pattern-length filler. The next pattern scans the updated buffer,
 * so it can match filler written by an earlier one. Empty patterns are skipped. Buffer length never changes.
 */
redaction_summary redact_in_place(std::vector<uint8_t>& buffer, const std::vector<pattern>& patterns);

// overwrites every span recorded in hits with filler; replaying each pattern's hits in order over the
// original buffer reproduces the buffer as every later pattern saw it
void apply_hits(std::vector<uint8_t>& buffer, const pattern_hits& hits);

/**
 * @brief Redact utf-8 text patterns from a copy of buffer.
 *
 * @return the redacted bytes, or invalid_encoding when a pattern is not valid utf-8
 */
result<std::vector<uint8_t>> redact(std::span<const uint8_t> buffer, const std::vector<std::string>& patterns);

} // namespace r3dact::engine
