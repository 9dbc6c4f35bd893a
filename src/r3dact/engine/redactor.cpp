#include "redactor.hpp"
#include "pattern_matcher.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace r3dact::engine {

size_t redaction_summary::total_matches() const noexcept {
  size_t total = 0;
  for (const auto& hit : hits) {
    total += hit.count();
  }
  return total;
}

void apply_hits(std::vector<uint8_t>& buffer, const pattern_hits& hits) {
  for (size_t offset : hits.offsets) {
    std::fill_n(buffer.begin() + static_cast<std::ptrdiff_t>(offset), hits.pattern_size, filler_byte);
  }
}

redaction_summary redact_in_place(std::vector<uint8_t>& buffer, const std::vector<pattern>& patterns) {
  auto log = redlog::get_logger("r3dact.redactor");

  redaction_summary summary;
  summary.hits.reserve(patterns.size());

  for (size_t index = 0; index < patterns.size(); ++index) {
    const pattern& pat = patterns[index];

    pattern_hits hits;
    hits.pattern_index = index;
    hits.pattern_size = pat.size();

    if (pat.empty()) {
      log.wrn("skipping empty pattern", redlog::field("index", index));
      summary.hits.push_back(std::move(hits));
      continue;
    }

    pattern_matcher matcher(pat);
    hits.offsets = matcher.search(buffer.data(), buffer.size());

    apply_hits(buffer, hits);
    for (size_t offset : hits.offsets) {
      log.ped(
          "redacted span", redlog::field("offset", utils::format_offset(offset)), redlog::field("size", pat.size())
      );
    }

    summary.bytes_redacted += hits.count() * pat.size();
    log.trc(
        "pattern applied", redlog::field("index", index), redlog::field("size", pat.size()),
        redlog::field("matches", hits.count())
    );
    summary.hits.push_back(std::move(hits));
  }

  return summary;
}

result<std::vector<uint8_t>> redact(std::span<const uint8_t> buffer, const std::vector<std::string>& patterns) {
  auto compiled = compile_patterns(patterns, pattern_notation::literal);
  if (!compiled.ok()) {
    return error_result<std::vector<uint8_t>>(compiled.status_info);
  }

  std::vector<uint8_t> output(buffer.begin(), buffer.end());
  redact_in_place(output, compiled.value);
  return ok_result(std::move(output));
}

} // namespace r3dact::engine
