#pragma once

#include "pattern.hpp"
#include "redactor.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace r3dact::engine {

enum class file_state { redacted, unchanged, missing, failed };

const char* file_state_name(file_state state) noexcept;

struct process_options {
  bool dry_run = false;        // scan and report only
  bool recursive = false;      // descend into directory arguments
  bool include_hidden = false; // keep dot-entries while descending
};

struct file_report {
  std::string path;
  file_state state = file_state::unchanged;
  size_t size = 0;
  bool written = false;
  redaction_summary summary;
  std::string error;
};

struct batch_report {
  std::vector<file_report> files;

  size_t count(file_state state) const noexcept;
  bool ok() const noexcept { return count(file_state::failed) == 0; }
};

// read -> redact -> write for each target file, one at a time.
// per-file failures are recorded in the report and never stop the batch.
class file_processor {
public:
  using report_callback = std::function<void(const file_report&)>;

  file_processor(std::vector<pattern> patterns, process_options options);

  file_report process_file(const std::filesystem::path& path) const;

  // inputs are handled in order; directories expand to their files when recursive is set
  batch_report process_all(const std::vector<std::string>& inputs, const report_callback& on_report = {}) const;

  const std::vector<pattern>& patterns() const { return patterns_; }

private:
  std::vector<pattern> patterns_;
  process_options options_;

  void log_redactions(const std::vector<uint8_t>& original, const redaction_summary& summary) const;
};

} // namespace r3dact::engine
