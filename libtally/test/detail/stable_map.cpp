//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/detail/stable_map.hpp"

#include "tally/test/test.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>

using namespace std::string_view_literals;
using namespace tally;

namespace {

struct fixture {
  fixture() {
    xs.insert({"foo", 42});
    xs["baz"] = 1337;
    xs.emplace("bar", 4711);
  }

  detail::stable_map<std::string, int> xs = {};
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("stable_map membership") {
    CHECK(not xs.contains("qux"));
    CHECK(xs.find("foo") != xs.end());
    CHECK_EQUAL(xs.count("baz"), 1u);
  }

  TEST("stable_map at") {
    CHECK_EQUAL(xs.at("foo"), 42);
    auto exception = std::out_of_range{""};
    try {
      [[maybe_unused]] auto _ = xs.at("qux");
    } catch (std::out_of_range& e) {
      exception = std::move(e);
    }
    CHECK_EQUAL(exception.what(),
                "tally::detail::vector_map::at out of range"sv);
  }

  TEST("stable_map preserves insertion order") {
    xs.clear();
    xs.insert({"qux", 3});
    xs.insert({"ax", 0});
    xs.insert({"erx", 1});
    xs.insert({"qtp", 2});
    CHECK_EQUAL(xs.size(), 4u);
    auto& vec = as_vector(xs);
    CHECK_EQUAL(vec.at(0).first, "qux");
    CHECK_EQUAL(vec.at(1).first, "ax");
    CHECK_EQUAL(vec.at(2).first, "erx");
    CHECK_EQUAL(vec.at(3).first, "qtp");
  }

  TEST("stable_map duplicates") {
    auto i = xs.insert({"foo", 666});
    CHECK(not i.second);
    CHECK_EQUAL(i.first->second, 42);
    CHECK_EQUAL(xs.size(), 3u);
  }

  TEST("stable_map insert_or_assign keeps position") {
    auto [i, inserted] = xs.insert_or_assign("foo", 1);
    CHECK(not inserted);
    CHECK_EQUAL(i->second, 1);
    CHECK_EQUAL(xs.begin()->first, "foo");
    CHECK_EQUAL(xs.begin()->second, 1);
    std::tie(i, inserted) = xs.insert_or_assign("qux", 2);
    CHECK(inserted);
    CHECK_EQUAL(xs.rbegin()->first, "qux");
  }

  TEST("stable_map reinsertion moves to the end") {
    xs.erase("foo");
    xs.insert({"foo", 42});
    CHECK_EQUAL(xs.begin()->first, "baz");
    CHECK_EQUAL(xs.rbegin()->first, "foo");
  }

  TEST("stable_map erase") {
    CHECK_EQUAL(xs.erase("qux"), 0u);
    CHECK_EQUAL(xs.erase("baz"), 1u);
    REQUIRE_EQUAL(xs.size(), 2u);
    CHECK_EQUAL(xs.begin()->second, 42);
    CHECK_EQUAL(xs.rbegin()->second, 4711);
    auto last = xs.erase(xs.begin());
    REQUIRE(last < xs.end());
    CHECK_EQUAL(last->first, "bar");
  }

  TEST("stable_map comparison") {
    using map_type = decltype(xs);
    CHECK((xs == map_type{{"foo", 42}, {"baz", 1337}, {"bar", 4711}}));
    CHECK((xs != map_type{{"foo", 42}, {"bar", 4711}, {"baz", 1337}}));
  }
}
