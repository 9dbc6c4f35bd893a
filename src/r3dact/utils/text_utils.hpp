#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace r3dact::utils {

// offset of the first byte that does not start a well-formed utf-8 sequence, or nullopt when the text is valid.
// rejects overlong forms, utf-16 surrogates and code points above U+10FFFF.
inline std::optional<size_t> find_invalid_utf8(std::string_view text) {
  const auto* data = reinterpret_cast<const uint8_t*>(text.data());
  const size_t size = text.size();
  size_t i = 0;

  while (i < size) {
    uint8_t lead = data[i];
    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t length = 0;
    uint8_t min_second = 0x80;
    uint8_t max_second = 0xbf;
    if (lead >= 0xc2 && lead <= 0xdf) {
      length = 2;
    } else if (lead >= 0xe0 && lead <= 0xef) {
      length = 3;
      if (lead == 0xe0) {
        min_second = 0xa0;
      } else if (lead == 0xed) {
        max_second = 0x9f;
      }
    } else if (lead >= 0xf0 && lead <= 0xf4) {
      length = 4;
      if (lead == 0xf0) {
        min_second = 0x90;
      } else if (lead == 0xf4) {
        max_second = 0x8f;
      }
    } else {
      return i;
    }

    if (i + length > size) {
      return i;
    }
    if (data[i + 1] < min_second || data[i + 1] > max_second) {
      return i;
    }
    for (size_t k = 2; k < length; ++k) {
      if ((data[i + k] & 0xc0) != 0x80) {
        return i;
      }
    }

    i += length;
  }

  return std::nullopt;
}

inline bool is_valid_utf8(std::string_view text) { return !find_invalid_utf8(text).has_value(); }

} // namespace r3dact::utils
