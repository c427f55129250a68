//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/entity_key.hpp"

#include "tally/test/entity.hpp"
#include "tally/test/test.hpp"

#include <fmt/format.h>

#include <limits>
#include <string>
#include <unordered_set>

using namespace std::string_literals;
using namespace tally;

TEST("entity keys compare by value") {
  auto x = entity_key{"user", {int64_t{1}}};
  auto y = entity_key{"user", {int64_t{1}}};
  CHECK_EQUAL(x, y);
  CHECK_NOT_EQUAL(x, (entity_key{"user", {int64_t{2}}}));
  CHECK_NOT_EQUAL(x, (entity_key{"article", {int64_t{1}}}));
  CHECK_NOT_EQUAL(x, (entity_key{"user", {uint64_t{1}}}));
  CHECK_NOT_EQUAL(x, (entity_key{"user", {int64_t{1}, int64_t{1}}}));
}

TEST("entity keys work as hash map keys") {
  auto xs = std::unordered_set<entity_key>{};
  xs.insert(entity_key{"user", {int64_t{1}}});
  xs.insert(entity_key{"user", {int64_t{1}}});
  xs.insert(entity_key{"user", {"alice"s, int64_t{1}}});
  xs.insert(entity_key{"user", {caf::none}});
  CHECK_EQUAL(xs.size(), 3u);
  CHECK(xs.contains(entity_key{"user", {"alice"s, int64_t{1}}}));
  CHECK(xs.contains(entity_key{"user", {caf::none}}));
  CHECK_EQUAL(std::hash<entity_key>{}(entity_key{"user", {int64_t{7}}}),
              std::hash<entity_key>{}(entity_key{"user", {int64_t{7}}}));
}

TEST("floating-point key components identify NaN with NaN") {
  auto nan = std::numeric_limits<double>::quiet_NaN();
  auto x = entity_key{"reading", {nan}};
  auto y = entity_key{"reading", {-std::numeric_limits<double>::quiet_NaN()}};
  CHECK(x == y);
  CHECK_EQUAL(hash(x), hash(y));
  CHECK(x != (entity_key{"reading", {1.0}}));
  CHECK(entity_key{"reading", {0.0}} == entity_key{"reading", {-0.0}});
  CHECK_EQUAL(hash(entity_key{"reading", {0.0}}),
              hash(entity_key{"reading", {-0.0}}));
  auto xs = std::unordered_set<entity_key>{x, y};
  CHECK_EQUAL(xs.size(), 1u);
}

TEST("key_of uses the current primary key") {
  auto user = test::make_user(1, true);
  CHECK_EQUAL(key_of(*user), (entity_key{"user", {int64_t{1}}}));
  user->set_primary_key({int64_t{2}});
  CHECK_EQUAL(key_of(*user), (entity_key{"user", {int64_t{2}}}));
  CHECK_EQUAL(persisted_key_of(*user), (entity_key{"user", {int64_t{1}}}));
}

TEST("key_of works for entities that were never persisted") {
  auto user = test::make_user(5);
  CHECK_EQUAL(key_of(*user), (entity_key{"user", {int64_t{5}}}));
  CHECK(not persisted_key_of(*user));
}

TEST("entity key formatting") {
  CHECK_EQUAL(fmt::to_string(entity_key{"user", {int64_t{42}}}), "user(42)");
  CHECK_EQUAL(fmt::to_string(
                entity_key{"membership", {"alice"s, uint64_t{7}, caf::none}}),
              "membership(\"alice\", 7, null)");
  CHECK_EQUAL(fmt::to_string(entity_key{"singleton", {}}), "singleton()");
}

TEST("static schema classification") {
  auto schema = test::user_schema();
  CHECK_EQUAL(std::string{schema->name()}, "user");
  CHECK(schema->classify("id") == attribute_kind::primary_key);
  CHECK(schema->classify("posts") == attribute_kind::one_to_many);
  CHECK(schema->classify("groups") == attribute_kind::many_to_many);
  CHECK(schema->classify("team") == attribute_kind::many_to_one);
  CHECK(schema->classify("unknown") == attribute_kind::column);
  CHECK(is_collection(attribute_kind::one_to_many));
  CHECK(is_collection(attribute_kind::many_to_many));
  CHECK(not is_collection(attribute_kind::many_to_one));
  CHECK(not is_collection(attribute_kind::primary_key));
}
