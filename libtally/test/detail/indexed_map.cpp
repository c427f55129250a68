//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/detail/indexed_map.hpp"

#include "tally/test/test.hpp"

#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

using namespace std::string_literals;
using namespace tally;

namespace {

auto keys(const detail::indexed_map<std::string, int>& xs) {
  auto result = std::vector<std::string>{};
  for (const auto& [key, value] : xs)
    result.push_back(key);
  return result;
}

struct fixture {
  fixture() {
    xs.insert({"foo", 42});
    xs.insert({"bar", 4711});
    xs.insert({"baz", 1337});
  }

  detail::indexed_map<std::string, int> xs = {};
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("indexed_map lookup") {
    CHECK(xs.contains("bar"));
    CHECK(not xs.contains("qux"));
    CHECK(xs.find("qux") == xs.end());
    REQUIRE(xs.find("baz") != xs.end());
    CHECK_EQUAL(xs.find("baz")->second, 1337);
    CHECK_EQUAL(xs.at("foo"), 42);
  }

  TEST("indexed_map at throws for missing keys") {
    auto what = std::string{};
    try {
      [[maybe_unused]] auto _ = xs.at("qux");
    } catch (const std::out_of_range& e) {
      what = e.what();
    }
    CHECK_EQUAL(what, "tally::detail::indexed_map::at out of range"s);
  }

  TEST("indexed_map rejects duplicates") {
    auto [i, inserted] = xs.insert({"bar", 0});
    CHECK(not inserted);
    CHECK_EQUAL(i->second, 4711);
    CHECK_EQUAL(xs.size(), 3u);
  }

  TEST("indexed_map insert_or_assign keeps position") {
    auto [i, inserted] = xs.insert_or_assign("foo", 1);
    CHECK(not inserted);
    CHECK_EQUAL(i->second, 1);
    CHECK_EQUAL(keys(xs), (std::vector{"foo"s, "bar"s, "baz"s}));
    std::tie(i, inserted) = xs.insert_or_assign("qux", 2);
    CHECK(inserted);
    CHECK_EQUAL(keys(xs), (std::vector{"foo"s, "bar"s, "baz"s, "qux"s}));
  }

  TEST("indexed_map erase keeps the index in sync") {
    CHECK_EQUAL(xs.erase("qux"), 0u);
    CHECK_EQUAL(xs.erase("foo"), 1u);
    CHECK_EQUAL(keys(xs), (std::vector{"bar"s, "baz"s}));
    CHECK_EQUAL(xs.at("bar"), 4711);
    CHECK_EQUAL(xs.at("baz"), 1337);
    auto next = xs.erase(xs.find("bar"));
    REQUIRE(next != xs.end());
    CHECK_EQUAL(next->first, "baz");
    CHECK(xs.find("baz") == xs.begin());
  }

  TEST("indexed_map reinsertion moves to the end") {
    xs.erase("foo");
    xs.insert({"foo", 0});
    CHECK_EQUAL(keys(xs), (std::vector{"bar"s, "baz"s, "foo"s}));
    CHECK_EQUAL(xs.at("foo"), 0);
    CHECK_EQUAL(xs.at("baz"), 1337);
  }

  TEST("indexed_map clear drops the index") {
    xs.clear();
    CHECK(xs.empty());
    CHECK(not xs.contains("foo"));
    xs.insert({"foo", 1});
    CHECK_EQUAL(xs.begin()->second, 1);
  }

  TEST("indexed_map stays consistent across many erasures") {
    xs.clear();
    for (auto i = 0; i < 1'000; ++i)
      xs.insert({std::to_string(i), i});
    for (auto i = 0; i < 1'000; i += 2)
      CHECK_EQUAL(xs.erase(std::to_string(i)), 1u);
    REQUIRE_EQUAL(xs.size(), 500u);
    for (auto i = 1; i < 1'000; i += 2)
      CHECK_EQUAL(xs.at(std::to_string(i)), i);
    CHECK_EQUAL(xs.begin()->first, "1");
  }

  TEST("indexed_map comparison") {
    using map_type = decltype(xs);
    CHECK((xs == map_type{{"foo", 42}, {"bar", 4711}, {"baz", 1337}}));
    CHECK((xs != map_type{{"bar", 4711}, {"foo", 42}, {"baz", 1337}}));
  }
}
