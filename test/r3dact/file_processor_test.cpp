#include <doctest/doctest.h>

#include "r3dact/engine/file_processor.hpp"
#include "r3dact/engine/pattern.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

namespace fs = std::filesystem;

using r3dact::engine::compile_patterns;
using r3dact::engine::file_processor;
using r3dact::engine::file_report;
using r3dact::engine::file_state;
using r3dact::engine::file_state_name;
using r3dact::engine::pattern_notation;
using r3dact::engine::process_options;
using r3dact::test_helpers::read_text_file;
using r3dact::test_helpers::temp_dir;
using r3dact::test_helpers::write_text_file;

file_processor make_processor(const std::vector<std::string>& patterns, process_options options = {}) {
  auto compiled = compile_patterns(patterns, pattern_notation::literal);
  REQUIRE(compiled.ok());
  return file_processor(compiled.value, options);
}

} // namespace

TEST_CASE("file processor redacts a file in place") {
  temp_dir dir;
  fs::path target = dir / "creds.txt";
  write_text_file(target, "secret=hunter2;other=ok");

  auto processor = make_processor({"hunter2"});
  file_report report = processor.process_file(target);

  CHECK(report.state == file_state::redacted);
  CHECK(report.written);
  CHECK(report.size == 23);
  CHECK(report.summary.total_matches() == 1);
  CHECK(read_text_file(target) == "secret=xxxxxxx;other=ok");
  CHECK(fs::file_size(target) == 23);
}

TEST_CASE("file processor leaves unmatched files untouched") {
  temp_dir dir;
  fs::path target = dir / "plain.txt";
  write_text_file(target, "nothing here");
  auto before = fs::last_write_time(target);

  auto processor = make_processor({"hunter2"});
  file_report report = processor.process_file(target);

  CHECK(report.state == file_state::unchanged);
  CHECK_FALSE(report.written);
  CHECK(read_text_file(target) == "nothing here");
  CHECK(fs::last_write_time(target) == before);
}

TEST_CASE("file processor dry run reports without writing") {
  temp_dir dir;
  fs::path target = dir / "creds.txt";
  write_text_file(target, "token token");

  process_options options;
  options.dry_run = true;
  auto processor = make_processor({"token"}, options);
  file_report report = processor.process_file(target);

  CHECK(report.state == file_state::redacted);
  CHECK_FALSE(report.written);
  CHECK(report.summary.total_matches() == 2);
  CHECK(read_text_file(target) == "token token");
}

TEST_CASE("file processor reports missing files") {
  temp_dir dir;
  auto processor = make_processor({"a"});
  file_report report = processor.process_file(dir / "absent.txt");
  CHECK(report.state == file_state::missing);
  CHECK_FALSE(report.written);
}

TEST_CASE("file processor rejects directories without recursion") {
  temp_dir dir;
  fs::create_directories(dir / "sub");

  auto processor = make_processor({"a"});
  auto batch = processor.process_all({(dir / "sub").string()});
  REQUIRE(batch.files.size() == 1);
  CHECK(batch.files[0].state == file_state::failed);
  CHECK(batch.files[0].error.find("directory") != std::string::npos);
  CHECK_FALSE(batch.ok());
}

TEST_CASE("batch continues past missing files") {
  temp_dir dir;
  write_text_file(dir / "one.txt", "pw=abc");
  write_text_file(dir / "two.txt", "pw=abc");

  std::vector<std::string> inputs = {
      (dir / "one.txt").string(), (dir / "missing.txt").string(), (dir / "two.txt").string()
  };

  std::vector<std::string> seen;
  auto processor = make_processor({"abc"});
  auto batch = processor.process_all(inputs, [&](const file_report& report) { seen.push_back(report.path); });

  REQUIRE(batch.files.size() == 3);
  CHECK(seen == inputs);
  CHECK(batch.files[1].state == file_state::missing);
  CHECK(batch.count(file_state::redacted) == 2);
  CHECK(batch.count(file_state::missing) == 1);
  CHECK(batch.ok());
  CHECK(read_text_file(dir / "one.txt") == "pw=xxx");
  CHECK(read_text_file(dir / "two.txt") == "pw=xxx");
}

TEST_CASE("batch expands directories when recursive") {
  temp_dir dir;
  fs::create_directories(dir / "tree" / "nested");
  write_text_file(dir / "tree" / "a.txt", "key=abc");
  write_text_file(dir / "tree" / "nested" / "b.txt", "abc");
  write_text_file(dir / "tree" / ".hidden", "abc");

  process_options options;
  options.recursive = true;
  auto processor = make_processor({"abc"}, options);
  auto batch = processor.process_all({(dir / "tree").string()});

  REQUIRE(batch.files.size() == 2);
  CHECK(batch.count(file_state::redacted) == 2);
  CHECK(read_text_file(dir / "tree" / "a.txt") == "key=xxx");
  CHECK(read_text_file(dir / "tree" / "nested" / "b.txt") == "xxx");
  CHECK(read_text_file(dir / "tree" / ".hidden") == "abc");
}

TEST_CASE("batch includes hidden files when asked") {
  temp_dir dir;
  fs::create_directories(dir / "tree");
  write_text_file(dir / "tree" / ".env", "abc");

  process_options options;
  options.recursive = true;
  options.include_hidden = true;
  auto processor = make_processor({"abc"}, options);
  auto batch = processor.process_all({(dir / "tree").string()});

  REQUIRE(batch.files.size() == 1);
  CHECK(read_text_file(dir / "tree" / ".env") == "xxx");
}

TEST_CASE("file processor treats dangling symlinks as missing") {
  temp_dir dir;
  fs::create_symlink(dir / "gone.txt", dir / "dangling.txt");

  auto processor = make_processor({"a"});
  auto batch = processor.process_all({(dir / "dangling.txt").string()});
  REQUIRE(batch.files.size() == 1);
  CHECK(batch.files[0].state == file_state::missing);
  CHECK(batch.ok());
}

TEST_CASE("file processor redacts every name of a hard linked file") {
  temp_dir dir;
  write_text_file(dir / "a.txt", "pw=hunter2");
  fs::create_hard_link(dir / "a.txt", dir / "b.txt");

  auto processor = make_processor({"hunter2"});
  file_report report = processor.process_file(dir / "a.txt");

  CHECK(report.state == file_state::redacted);
  CHECK(read_text_file(dir / "a.txt") == "pw=xxxxxxx");
  CHECK(read_text_file(dir / "b.txt") == "pw=xxxxxxx");
}

TEST_CASE("batch continues past unreadable files") {
  if (::geteuid() == 0) {
    MESSAGE("skipped: permission checks do not apply to root");
    return;
  }

  temp_dir dir;
  write_text_file(dir / "one.txt", "pw=abc");
  write_text_file(dir / "locked.txt", "pw=abc");
  write_text_file(dir / "three.txt", "pw=abc");
  fs::permissions(dir / "locked.txt", fs::perms::none);

  auto processor = make_processor({"abc"});
  auto batch = processor.process_all(
      {(dir / "one.txt").string(), (dir / "locked.txt").string(), (dir / "three.txt").string()}
  );

  fs::permissions(dir / "locked.txt", fs::perms::owner_read | fs::perms::owner_write);

  REQUIRE(batch.files.size() == 3);
  CHECK(batch.files[1].state == file_state::failed);
  CHECK(batch.files[1].error.find("failed to read") == 0);
  CHECK(batch.count(file_state::redacted) == 2);
  CHECK_FALSE(batch.ok());
  CHECK(read_text_file(dir / "locked.txt") == "pw=abc");
  CHECK(read_text_file(dir / "three.txt") == "pw=xxx");
}

TEST_CASE("file states have stable names") {
  CHECK(std::string(file_state_name(file_state::redacted)) == "redacted");
  CHECK(std::string(file_state_name(file_state::unchanged)) == "unchanged");
  CHECK(std::string(file_state_name(file_state::missing)) == "missing");
  CHECK(std::string(file_state_name(file_state::failed)) == "failed");
}
