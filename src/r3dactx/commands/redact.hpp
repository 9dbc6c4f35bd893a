#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace r3dactx::commands {

struct redact_settings {
  bool hex = false;
  bool dry_run = false;
  bool recursive = false;
  bool include_hidden = false;
};

/**
 * @brief Redact patterns from files in place
 *
 * @param files Paths to process, in order
 * @param patterns Patterns to overwrite with filler, applied in order
 * @param settings Notation and traversal switches
 * @param out Progress output
 * @param err Error output
 * @return 0 when the batch completed, 1 on bad patterns or any file failure
 */
int redact(
    const std::vector<std::string>& files, const std::vector<std::string>& patterns, const redact_settings& settings,
    std::ostream& out, std::ostream& err
);

} // namespace r3dactx::commands
