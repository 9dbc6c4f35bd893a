#pragma once

#include "pattern.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace r3dact::engine {

// literal matching with a Boyer-Moore-Horspool skip table
class pattern_matcher {
public:
  explicit pattern_matcher(pattern literal);

  // offsets of all non-overlapping occurrences, left to right
  std::vector<size_t> search(const uint8_t* data, size_t size) const;

  // empty patterns never match
  bool is_valid() const { return !literal_.empty(); }

private:
  pattern literal_;
  std::array<size_t, 256> shift_table_{};

  void build_shift_table();
  bool match_at_position(const uint8_t* data, size_t pos) const;
};

} // namespace r3dact::engine
