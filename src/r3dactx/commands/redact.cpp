#include "redact.hpp"
#include <r3dact/r3dact.hpp>
#include <redlog.hpp>
#include <exception>
#include <ostream>

namespace r3dactx::commands {

namespace {

void print_report(
    const r3dact::engine::file_report& report, const std::vector<r3dact::engine::pattern>& patterns, bool dry_run,
    std::ostream& out, std::ostream& err
) {
  using r3dact::engine::file_state;

  switch (report.state) {
  case file_state::missing:
    out << "No such file " << report.path << std::endl;
    return;
  case file_state::failed:
    err << "error: " << report.path << ": " << report.error << std::endl;
    return;
  case file_state::redacted:
  case file_state::unchanged:
    break;
  }

  out << report.path << std::endl;
  for (const auto& hits : report.summary.hits) {
    const auto& pat = patterns[hits.pattern_index];
    out << "Cleaning " << r3dact::engine::describe_pattern(pat);
    if (pat.empty()) {
      out << " (empty pattern, skipped)" << std::endl;
      continue;
    }
    out << ": " << (dry_run ? "would replace " : "replaced ") << hits.count()
        << (hits.count() == 1 ? " occurrence" : " occurrences") << std::endl;
  }
}

} // namespace

int redact(
    const std::vector<std::string>& files, const std::vector<std::string>& patterns, const redact_settings& settings,
    std::ostream& out, std::ostream& err
) {
  auto log = redlog::get_logger("r3dactx.commands.redact");

  try {
    auto notation = settings.hex ? r3dact::engine::pattern_notation::hex : r3dact::engine::pattern_notation::literal;
    auto compiled = r3dact::engine::compile_patterns(patterns, notation);
    if (!compiled.ok()) {
      log.err("invalid pattern", redlog::field("error", compiled.status_info.message));
      err << "error: " << compiled.status_info.message << std::endl;
      return 1;
    }

    r3dact::engine::process_options options;
    options.dry_run = settings.dry_run;
    options.recursive = settings.recursive;
    options.include_hidden = settings.include_hidden;

    log.inf(
        "redacting", redlog::field("files", files.size()), redlog::field("patterns", compiled.value.size()),
        redlog::field("hex", settings.hex), redlog::field("dry_run", settings.dry_run),
        redlog::field("recursive", settings.recursive)
    );

    r3dact::engine::file_processor processor(compiled.value, options);
    auto batch = processor.process_all(files, [&](const r3dact::engine::file_report& report) {
      print_report(report, processor.patterns(), settings.dry_run, out, err);
    });

    out << "Done." << std::endl;
    return batch.ok() ? 0 : 1;

  } catch (const std::exception& e) {
    log.err("redaction failed", redlog::field("error", e.what()));
    err << "error: " << e.what() << std::endl;
    return 1;
  }
}

} // namespace r3dactx::commands
