#include "hex_pattern.hpp"
#include "hex_utils.hpp"
#include <redlog.hpp>
#include <sstream>
#include <cctype>

namespace r3dact::utils {

namespace {

std::string strip_comments_hex_pattern(const std::string& pattern) {
  std::string result;
  std::istringstream stream(pattern);
  std::string line;

  while (std::getline(stream, line)) {
    size_t comment_pos = std::string::npos;
    for (const char* delimiter : {"--", "//", "#", ";"}) {
      size_t pos = line.find(delimiter);
      if (pos != std::string::npos && pos < comment_pos) {
        comment_pos = pos;
      }
    }

    if (comment_pos != std::string::npos) {
      line = line.substr(0, comment_pos);
    }

    if (!result.empty() && !line.empty()) {
      result += " ";
    }
    result += line;
  }

  return result;
}

} // namespace

bool is_valid_hex_pattern(const std::string& pattern) {
  std::string normalized = normalize_hex_pattern(pattern);

  // each byte needs exactly 2 hex digits
  if (normalized.length() % 2 != 0) {
    return false;
  }

  for (char c : normalized) {
    if (!is_hex_digit(c)) {
      return false;
    }
  }

  return true;
}

bool has_hex_wildcards(const std::string& pattern) {
  return normalize_hex_pattern(pattern).find('?') != std::string::npos;
}

std::vector<uint8_t> parse_hex_pattern(const std::string& hex) {
  auto log = redlog::get_logger("r3dact.hex_pattern");

  std::vector<uint8_t> bytes;
  std::string clean_hex = normalize_hex_pattern(hex);

  if (!is_valid_hex_pattern(clean_hex)) {
    log.err("invalid hex pattern", redlog::field("pattern", hex));
    return bytes;
  }

  bytes.reserve(clean_hex.length() / 2);
  for (size_t i = 0; i < clean_hex.length(); i += 2) {
    uint8_t high = parse_hex_digit(clean_hex[i]);
    uint8_t low = parse_hex_digit(clean_hex[i + 1]);
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }

  return bytes;
}

std::string normalize_hex_pattern(const std::string& pattern) {
  std::string stripped = strip_comments_hex_pattern(pattern);

  std::string result;
  result.reserve(stripped.length());

  for (char c : stripped) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      continue;
    } else if (std::isalpha(uc)) {
      result.push_back(static_cast<char>(std::tolower(uc)));
    } else {
      result.push_back(c);
    }
  }

  return result;
}

} // namespace r3dact::utils
