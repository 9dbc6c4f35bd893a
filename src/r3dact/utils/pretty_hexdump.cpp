#include "pretty_hexdump.hpp"
#include <redlog.hpp>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <vector>

namespace r3dact::utils {

namespace {

// color scheme for different element types
constexpr auto offset_color = redlog::color::bright_cyan;
constexpr auto unchanged_color = redlog::color::white;
constexpr auto before_change_color = redlog::color::cyan;
constexpr auto after_change_color = redlog::color::red;
constexpr auto ascii_color = redlog::color::bright_black;

struct byte_window {
  size_t start = 0;
  size_t end = 0;
};

byte_window context_window(size_t data_size, size_t match_offset, size_t match_size, const hexdump_options& opts) {
  byte_window window;
  window.start = (match_offset >= opts.context_bytes) ? match_offset - opts.context_bytes : 0;
  window.end = std::min(data_size, match_offset + match_size + opts.context_bytes);
  return window;
}

std::string format_hex_byte(uint8_t byte, redlog::color color = redlog::color::none) {
  std::ostringstream oss;
  oss << std::hex << std::setw(2) << std::setfill('0') << std::nouppercase << static_cast<int>(byte);
  return redlog::detail::colorize(oss.str(), color);
}

std::string format_ascii_char(uint8_t byte, redlog::color color = redlog::color::none) {
  char c = (byte >= 32 && byte <= 126) ? static_cast<char>(byte) : '.';
  return redlog::detail::colorize(std::string(1, c), color);
}

std::string format_offset_column(uint64_t offset) {
  std::ostringstream oss;
  oss << std::hex << std::setw(8) << std::setfill('0') << std::nouppercase << offset << ":";
  return redlog::detail::colorize(oss.str(), offset_color);
}

/**
 * format a line of hex bytes; bytes flagged in highlight_mask use highlight_color.
 */
std::string format_hex_line(
    const uint8_t* data, size_t line_size, size_t bytes_per_line, const std::vector<bool>& highlight_mask = {},
    redlog::color highlight_color = redlog::color::none
) {
  std::ostringstream oss;

  for (size_t i = 0; i < bytes_per_line; ++i) {
    if (i > 0) {
      oss << " ";
    }

    if (i < line_size) {
      redlog::color color = unchanged_color;
      if (i < highlight_mask.size() && highlight_mask[i]) {
        color = highlight_color;
      }
      oss << format_hex_byte(data[i], color);
    } else {
      oss << "  ";
    }

    // extra gap after 8 bytes
    if (i == 7) {
      oss << " ";
    }
  }

  return oss.str();
}

std::string format_ascii_line(
    const uint8_t* data, size_t line_size, const std::vector<bool>& highlight_mask = {},
    redlog::color highlight_color = redlog::color::none
) {
  std::ostringstream oss;
  oss << "|";

  for (size_t i = 0; i < line_size; ++i) {
    redlog::color color = ascii_color;
    if (i < highlight_mask.size() && highlight_mask[i]) {
      color = highlight_color;
    }
    oss << format_ascii_char(data[i], color);
  }

  oss << "|";
  return oss.str();
}

} // namespace

std::string format_hexdump(const uint8_t* data, size_t size, uint64_t base_offset, const hexdump_options& opts) {
  if (!data || size == 0) {
    return "";
  }

  std::ostringstream result;
  size_t lines_shown = 0;

  for (size_t offset = 0; offset < size; offset += opts.bytes_per_line) {
    if (lines_shown >= opts.max_lines) {
      result << "... (truncated, " << (size - offset) << " more bytes)\n";
      break;
    }

    size_t line_size = std::min(opts.bytes_per_line, size - offset);

    result << format_offset_column(base_offset + offset) << "  ";
    result << format_hex_line(data + offset, line_size, opts.bytes_per_line);

    if (opts.show_ascii) {
      result << "  " << format_ascii_line(data + offset, line_size);
    }

    result << "\n";
    lines_shown++;
  }

  return result.str();
}

std::string format_redaction_hexdump(
    const uint8_t* before, const uint8_t* after, size_t data_size, size_t match_offset, size_t match_size,
    const hexdump_options& opts
) {
  if (!before || !after || data_size == 0 || match_offset >= data_size) {
    return "";
  }

  byte_window window = context_window(data_size, match_offset, match_size, opts);

  std::ostringstream result;
  size_t lines_shown = 0;

  for (size_t offset = window.start; offset < window.end; offset += opts.bytes_per_line) {
    if (lines_shown >= opts.max_lines) {
      result << "... (truncated)\n";
      break;
    }

    size_t line_size = std::min(opts.bytes_per_line, window.end - offset);

    std::vector<bool> differences(line_size);
    for (size_t i = 0; i < line_size; ++i) {
      differences[i] = before[offset + i] != after[offset + i];
    }

    result << format_offset_column(offset) << "  before: ";
    result << format_hex_line(before + offset, line_size, opts.bytes_per_line, differences, before_change_color);
    if (opts.show_ascii) {
      result << "  " << format_ascii_line(before + offset, line_size, differences, before_change_color);
    }
    result << "\n";

    result << "           after:  ";
    result << format_hex_line(after + offset, line_size, opts.bytes_per_line, differences, after_change_color);
    if (opts.show_ascii) {
      result << "  " << format_ascii_line(after + offset, line_size, differences, after_change_color);
    }
    result << "\n";

    lines_shown++;
  }

  return result.str();
}

} // namespace r3dact::utils
