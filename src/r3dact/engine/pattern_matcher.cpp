#include "pattern_matcher.hpp"
#include <cstring>
#include <utility>

namespace r3dact::engine {

pattern_matcher::pattern_matcher(pattern literal) : literal_(std::move(literal)) { build_shift_table(); }

void pattern_matcher::build_shift_table() {
  const size_t pattern_len = literal_.size();
  if (pattern_len == 0) {
    return;
  }

  shift_table_.fill(pattern_len);

  for (size_t i = 0; i + 1 < pattern_len; ++i) {
    shift_table_[literal_.bytes[i]] = pattern_len - 1 - i;
  }
}

std::vector<size_t> pattern_matcher::search(const uint8_t* data, size_t size) const {
  std::vector<size_t> results;
  if (!is_valid() || !data || size < literal_.size()) {
    return results;
  }

  const size_t pattern_len = literal_.size();
  size_t i = 0;
  while (i + pattern_len <= size) {
    if (match_at_position(data, i)) {
      results.push_back(i);
      // resume after the match; occurrences never overlap
      i += pattern_len;
    } else {
      i += shift_table_[data[i + pattern_len - 1]];
    }
  }

  return results;
}

bool pattern_matcher::match_at_position(const uint8_t* data, size_t pos) const {
  return std::memcmp(data + pos, literal_.bytes.data(), literal_.size()) == 0;
}

} // namespace r3dact::engine
