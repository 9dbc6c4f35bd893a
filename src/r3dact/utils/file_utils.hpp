#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

namespace r3dact::utils {

// whole-file reading; ec carries the reason on failure
std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& file_path, std::error_code& ec);

// writes into a temporary sibling, copies the original permissions and renames it over file_path.
// the original is left untouched when any step fails. symlinks are resolved so the link itself survives.
// fails up front when file_path is not writable. hard linked files are truncated and rewritten in place
// so every name sees the new contents.
bool write_file_atomic(const std::filesystem::path& file_path, const std::vector<uint8_t>& data, std::error_code& ec);

// file system utilities
bool file_exists(const std::filesystem::path& file_path);
bool is_hidden_name(const std::filesystem::path& file_path);

// regular files beneath root in sorted order. symlinks are not followed; dot-entries are pruned unless include_hidden.
std::vector<std::filesystem::path> list_files_recursive(
    const std::filesystem::path& root, bool include_hidden, std::error_code& ec
);

} // namespace r3dact::utils
