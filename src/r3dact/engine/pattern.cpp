#include "pattern.hpp"
#include "utils/hex_pattern.hpp"
#include "utils/hex_utils.hpp"
#include "utils/text_utils.hpp"
#include <redlog.hpp>

namespace r3dact::engine {

result<pattern> parse_literal(std::string_view text) {
  if (auto bad_offset = utils::find_invalid_utf8(text)) {
    return error_result<pattern>(
        error_code::invalid_encoding, "pattern is not valid utf-8 (byte offset " + std::to_string(*bad_offset) + ")"
    );
  }

  pattern parsed;
  parsed.bytes.assign(text.begin(), text.end());
  parsed.source = std::string(text);
  parsed.notation = pattern_notation::literal;
  return ok_result(std::move(parsed));
}

result<pattern> parse_hex(std::string_view hex) {
  std::string hex_str(hex);
  if (utils::has_hex_wildcards(hex_str)) {
    return error_result<pattern>(error_code::invalid_pattern, "wildcards are not supported in redaction patterns");
  }
  if (!utils::is_valid_hex_pattern(hex_str)) {
    return error_result<pattern>(error_code::invalid_pattern, "invalid hex pattern");
  }

  pattern parsed;
  parsed.bytes = utils::parse_hex_pattern(hex_str);
  parsed.source = std::move(hex_str);
  parsed.notation = pattern_notation::hex;
  return ok_result(std::move(parsed));
}

result<std::vector<pattern>> compile_patterns(const std::vector<std::string>& inputs, pattern_notation notation) {
  auto log = redlog::get_logger("r3dact.pattern");

  std::vector<pattern> compiled;
  compiled.reserve(inputs.size());

  for (size_t i = 0; i < inputs.size(); ++i) {
    auto parsed = notation == pattern_notation::hex ? parse_hex(inputs[i]) : parse_literal(inputs[i]);
    if (!parsed.ok()) {
      log.err(
          "failed to compile pattern", redlog::field("index", i),
          redlog::field("code", error_code_name(parsed.status_info.code)),
          redlog::field("error", parsed.status_info.message)
      );
      return error_result<std::vector<pattern>>(
          parsed.status_info.code, "pattern #" + std::to_string(i + 1) + ": " + parsed.status_info.message
      );
    }

    log.dbg(
        "compiled pattern", redlog::field("index", i), redlog::field("size", parsed.value.size()),
        redlog::field("bytes", utils::format_bytes(parsed.value.bytes))
    );
    compiled.push_back(std::move(parsed.value));
  }

  return ok_result(std::move(compiled));
}

std::string describe_pattern(const pattern& pat) {
  if (pat.notation == pattern_notation::hex) {
    return "[" + utils::format_bytes(pat.bytes) + "]";
  }
  return "\"" + utils::format_escaped(pat.bytes) + "\"";
}

} // namespace r3dact::engine
