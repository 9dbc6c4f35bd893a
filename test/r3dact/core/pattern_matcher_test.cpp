#include <doctest/doctest.h>

#include "r3dact/engine/pattern.hpp"
#include "r3dact/engine/pattern_matcher.hpp"

#include <vector>

namespace {

using r3dact::engine::parse_hex;
using r3dact::engine::parse_literal;
using r3dact::engine::pattern;
using r3dact::engine::pattern_matcher;

} // namespace

TEST_CASE("pattern matcher finds exact matches") {
  std::vector<uint8_t> data = {0x90, 0x48, 0x89, 0xe5, 0x90};
  auto parsed = parse_hex("48 89 e5");
  REQUIRE(parsed.ok());

  pattern_matcher matcher(parsed.value);
  auto matches = matcher.search(data.data(), data.size());
  REQUIRE(matches.size() == 1);
  CHECK(matches[0] == 1);
}

TEST_CASE("pattern matcher does not report overlapping matches") {
  std::vector<uint8_t> data = {0x90, 0x90, 0x90, 0x90, 0x90};
  auto parsed = parse_hex("90 90");
  REQUIRE(parsed.ok());

  pattern_matcher matcher(parsed.value);
  auto matches = matcher.search(data.data(), data.size());
  REQUIRE(matches.size() == 2);
  CHECK(matches[0] == 0);
  CHECK(matches[1] == 2);
}

TEST_CASE("pattern matcher finds matches at buffer edges") {
  std::string text = "abXXXXab";
  std::vector<uint8_t> data(text.begin(), text.end());
  auto parsed = parse_literal("ab");
  REQUIRE(parsed.ok());

  pattern_matcher matcher(parsed.value);
  auto matches = matcher.search(data.data(), data.size());
  REQUIRE(matches.size() == 2);
  CHECK(matches[0] == 0);
  CHECK(matches[1] == 6);
}

TEST_CASE("pattern matcher handles repeated prefixes") {
  std::string text = "aabaab";
  std::vector<uint8_t> data(text.begin(), text.end());
  auto parsed = parse_literal("aab");
  REQUIRE(parsed.ok());

  pattern_matcher matcher(parsed.value);
  auto matches = matcher.search(data.data(), data.size());
  REQUIRE(matches.size() == 2);
  CHECK(matches[0] == 0);
  CHECK(matches[1] == 3);
}

TEST_CASE("pattern matcher returns nothing for short or empty input") {
  auto parsed = parse_literal("longer");
  REQUIRE(parsed.ok());
  pattern_matcher matcher(parsed.value);

  std::vector<uint8_t> data = {'l', 'o'};
  CHECK(matcher.search(data.data(), data.size()).empty());
  CHECK(matcher.search(nullptr, 0).empty());
}

TEST_CASE("empty patterns never match") {
  pattern_matcher matcher(pattern{});
  std::vector<uint8_t> data = {0x00, 0x01};
  CHECK_FALSE(matcher.is_valid());
  CHECK(matcher.search(data.data(), data.size()).empty());
}
