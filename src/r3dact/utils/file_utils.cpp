#include "file_utils.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

namespace r3dact::utils {

namespace fs = std::filesystem;

namespace {

constexpr int k_max_temp_attempts = 64;

std::error_code last_error() {
  int err = errno;
  if (err == 0) {
    return std::make_error_code(std::errc::io_error);
  }
  return std::error_code(err, std::generic_category());
}

fs::path temp_sibling(const fs::path& target, std::error_code& ec) {
  for (int attempt = 0; attempt < k_max_temp_attempts; ++attempt) {
    fs::path candidate = target;
    candidate += ".r3dact-" + std::to_string(attempt) + ".tmp";
    if (!fs::exists(candidate, ec) && !ec) {
      return candidate;
    }
    if (ec) {
      return {};
    }
  }
  ec = std::make_error_code(std::errc::file_exists);
  return {};
}

void discard_temp(const fs::path& temp) {
  std::error_code remove_ec;
  if (!fs::remove(temp, remove_ec) && remove_ec) {
    auto log = redlog::get_logger("r3dact.file_utils");
    log.wrn(
        "failed to remove temporary file", redlog::field("path", temp.string()),
        redlog::field("error", remove_ec.message())
    );
  }
}

bool overwrite_in_place(const fs::path& target, const std::vector<uint8_t>& data, std::error_code& ec) {
  errno = 0;
  std::ofstream file(target, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    ec = last_error();
    return false;
  }

  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file.flush();
  if (!file.good()) {
    ec = last_error();
    return false;
  }
  return true;
}

} // namespace

std::optional<std::vector<uint8_t>> read_file(const fs::path& file_path, std::error_code& ec) {
  ec.clear();
  errno = 0;

  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    ec = last_error();
    return std::nullopt;
  }

  std::vector<uint8_t> data;
  data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    ec = last_error();
    return std::nullopt;
  }
  return data;
}

bool write_file_atomic(const fs::path& file_path, const std::vector<uint8_t>& data, std::error_code& ec) {
  ec.clear();

  fs::path target = file_path;
  if (fs::is_symlink(file_path, ec)) {
    target = fs::canonical(file_path, ec);
  }
  if (ec) {
    return false;
  }

  // rename only needs a writable directory; the file itself must be writable too
  errno = 0;
  if (::access(target.c_str(), W_OK) != 0) {
    ec = last_error();
    return false;
  }

  // other names share the inode; replacing it would leave their contents unredacted
  auto links = fs::hard_link_count(target, ec);
  if (ec) {
    return false;
  }
  if (links > 1) {
    auto log = redlog::get_logger("r3dact.file_utils");
    log.dbg(
        "hard linked file, overwriting in place", redlog::field("path", target.string()),
        redlog::field("links", links)
    );
    return overwrite_in_place(target, data, ec);
  }

  fs::perms original_perms = fs::status(target, ec).permissions();
  if (ec) {
    return false;
  }

  fs::path temp = temp_sibling(target, ec);
  if (ec) {
    return false;
  }

  errno = 0;
  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      ec = last_error();
      return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file.good()) {
      ec = last_error();
      file.close();
      discard_temp(temp);
      return false;
    }
  }

  fs::permissions(temp, original_perms, fs::perm_options::replace, ec);
  if (ec) {
    discard_temp(temp);
    return false;
  }

  fs::rename(temp, target, ec);
  if (ec) {
    discard_temp(temp);
    return false;
  }

  return true;
}

bool file_exists(const fs::path& file_path) {
  std::error_code ec;
  return fs::exists(file_path, ec);
}

bool is_hidden_name(const fs::path& file_path) {
  std::string name = file_path.filename().string();
  return name.size() > 1 && name[0] == '.' && name != "..";
}

std::vector<fs::path> list_files_recursive(const fs::path& root, bool include_hidden, std::error_code& ec) {
  auto log = redlog::get_logger("r3dact.file_utils");
  std::vector<fs::path> files;
  ec.clear();

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return files;
  }

  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return files;
    }

    const fs::directory_entry& entry = *it;
    if (!include_hidden && is_hidden_name(entry.path())) {
      log.ped("skipping hidden entry", redlog::field("path", entry.path().string()));
      if (entry.is_directory(ec)) {
        it.disable_recursion_pending();
      }
      ec.clear();
      continue;
    }

    std::error_code entry_ec;
    if (entry.is_symlink(entry_ec)) {
      log.ped("skipping symlink", redlog::field("path", entry.path().string()));
      continue;
    }
    if (entry.is_regular_file(entry_ec)) {
      files.push_back(entry.path());
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace r3dact::utils
