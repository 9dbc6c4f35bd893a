#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace r3dact::utils {

/**
 * options for controlling hexdump formatting and appearance.
 */
struct hexdump_options {
  size_t bytes_per_line = 16; // number of bytes to display per line
  bool show_ascii = true;     // include ascii representation column
  size_t context_bytes = 8;   // bytes of context around a match
  size_t max_lines = 32;      // maximum lines to display (prevents spam)
};

/**
 * create a hexdump of a buffer. respects redlog color settings.
 *
 * @param data pointer to data to dump
 * @param size number of bytes to dump
 * @param base_offset offset printed for the first byte
 * @param opts formatting options
 * @return formatted hexdump string
 */
std::string format_hexdump(
    const uint8_t* data, size_t size, uint64_t base_offset = 0, const hexdump_options& opts = {}
);

/**
 * before/after comparison around a redacted span.
 * both buffers must be data_size bytes long; changed bytes are cyan before and red after.
 */
std::string format_redaction_hexdump(
    const uint8_t* before, const uint8_t* after, size_t data_size, size_t match_offset, size_t match_size,
    const hexdump_options& opts = {}
);

} // namespace r3dact::utils
