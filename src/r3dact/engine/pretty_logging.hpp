#pragma once

#include "pattern.hpp"
#include "utils/hex_utils.hpp"
#include "utils/pretty_hexdump.hpp"
#include <redlog.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace r3dact::engine::pretty_logging {

inline void log_redaction(
    redlog::logger& log, const pattern& pat, const std::vector<uint8_t>& before, const std::vector<uint8_t>& after,
    size_t match_offset
) {
  log.trc(
      "redacted", redlog::field("pattern", describe_pattern(pat)),
      redlog::field("offset", utils::format_offset(match_offset)), redlog::field("size", pat.size())
  );

  if (before.size() != after.size()) {
    return;
  }

  std::string redaction_hexdump =
      utils::format_redaction_hexdump(before.data(), after.data(), before.size(), match_offset, pat.size());
  if (!redaction_hexdump.empty()) {
    log.dbg(redlog::fmt("redaction\n%s", redaction_hexdump));
  }
}

inline void log_file_head(redlog::logger& log, const std::vector<uint8_t>& data) {
  utils::hexdump_options opts;
  opts.max_lines = 4;
  std::string head = utils::format_hexdump(data.data(), data.size(), 0, opts);
  if (!head.empty()) {
    log.ped(redlog::fmt("file head\n%s", head));
  }
}

} // namespace r3dact::engine::pretty_logging
