#include "file_processor.hpp"
#include "pretty_logging.hpp"
#include "utils/file_utils.hpp"
#include <redlog.hpp>
#include <system_error>
#include <utility>

namespace r3dact::engine {

namespace fs = std::filesystem;

namespace {

file_report failed_report(const fs::path& path, std::string error) {
  file_report report;
  report.path = path.string();
  report.state = file_state::failed;
  report.error = std::move(error);
  return report;
}

} // namespace

const char* file_state_name(file_state state) noexcept {
  switch (state) {
  case file_state::redacted:
    return "redacted";
  case file_state::unchanged:
    return "unchanged";
  case file_state::missing:
    return "missing";
  case file_state::failed:
    return "failed";
  }
  return "unknown";
}

size_t batch_report::count(file_state state) const noexcept {
  size_t total = 0;
  for (const auto& file : files) {
    if (file.state == state) {
      total++;
    }
  }
  return total;
}

file_processor::file_processor(std::vector<pattern> patterns, process_options options)
    : patterns_(std::move(patterns)), options_(options) {}

file_report file_processor::process_file(const fs::path& path) const {
  auto log = redlog::get_logger("r3dact.file_processor");

  file_report report;
  report.path = path.string();

  if (!utils::file_exists(path)) {
    log.wrn("no such file", redlog::field("path", report.path));
    report.state = file_state::missing;
    return report;
  }

  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    log.err("path is a directory", redlog::field("path", report.path));
    return failed_report(path, "is a directory (use --recursive)");
  }

  auto original = utils::read_file(path, ec);
  if (!original) {
    log.err("failed to read file", redlog::field("path", report.path), redlog::field("error", ec.message()));
    return failed_report(path, "failed to read: " + ec.message());
  }

  report.size = original->size();
  log.dbg("read file", redlog::field("path", report.path), redlog::field("size", report.size));
  pretty_logging::log_file_head(log, *original);

  std::vector<uint8_t> redacted = *original;
  report.summary = redact_in_place(redacted, patterns_);
  log_redactions(*original, report.summary);

  if (!report.summary.matched()) {
    log.vrb("no matches", redlog::field("path", report.path));
    report.state = file_state::unchanged;
    return report;
  }

  report.state = file_state::redacted;
  if (options_.dry_run) {
    log.vrb(
        "dry run, not writing", redlog::field("path", report.path),
        redlog::field("matches", report.summary.total_matches())
    );
    return report;
  }

  if (!utils::write_file_atomic(path, redacted, ec)) {
    log.err("failed to write file", redlog::field("path", report.path), redlog::field("error", ec.message()));
    return failed_report(path, "failed to write: " + ec.message());
  }

  report.written = true;
  log.vrb(
      "file redacted", redlog::field("path", report.path), redlog::field("matches", report.summary.total_matches()),
      redlog::field("bytes_redacted", report.summary.bytes_redacted)
  );
  return report;
}

batch_report file_processor::process_all(
    const std::vector<std::string>& inputs, const report_callback& on_report
) const {
  auto log = redlog::get_logger("r3dact.file_processor");

  batch_report batch;
  auto record = [&](file_report report) {
    log.dbg(
        "file processed", redlog::field("path", report.path), redlog::field("state", file_state_name(report.state)),
        redlog::field("matches", report.summary.total_matches())
    );
    if (on_report) {
      on_report(report);
    }
    batch.files.push_back(std::move(report));
  };

  for (const auto& input : inputs) {
    fs::path path(input);

    std::error_code ec;
    if (options_.recursive && fs::is_directory(path, ec)) {
      auto files = utils::list_files_recursive(path, options_.include_hidden, ec);
      if (ec) {
        log.err("failed to walk directory", redlog::field("path", input), redlog::field("error", ec.message()));
        record(failed_report(path, "failed to walk directory: " + ec.message()));
        continue;
      }

      log.vrb("expanded directory", redlog::field("path", input), redlog::field("files", files.size()));
      for (const auto& file : files) {
        record(process_file(file));
      }
      continue;
    }

    record(process_file(path));
  }

  log.inf(
      "batch complete", redlog::field("files", batch.files.size()),
      redlog::field("redacted", batch.count(file_state::redacted)),
      redlog::field("unchanged", batch.count(file_state::unchanged)),
      redlog::field("missing", batch.count(file_state::missing)),
      redlog::field("failed", batch.count(file_state::failed))
  );
  return batch;
}

void file_processor::log_redactions(const std::vector<uint8_t>& original, const redaction_summary& summary) const {
  int log_level = static_cast<int>(redlog::get_level());
  if (log_level < static_cast<int>(redlog::level::trace)) {
    return;
  }

  // replay the fills pattern by pattern so each dump shows the buffer as that pattern saw it
  auto log = redlog::get_logger("r3dact.file_processor");
  std::vector<uint8_t> state = original;
  for (const auto& hits : summary.hits) {
    const pattern& pat = patterns_[hits.pattern_index];
    std::vector<uint8_t> pattern_before = state;
    apply_hits(state, hits);
    for (size_t offset : hits.offsets) {
      pretty_logging::log_redaction(log, pat, pattern_before, state, offset);
    }
  }
}

} // namespace r3dact::engine
