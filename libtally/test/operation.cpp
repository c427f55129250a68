//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/operation.hpp"

#include "tally/test/entity.hpp"
#include "tally/test/test.hpp"

#include <fmt/format.h>

#include <optional>
#include <string>

using namespace std::string_literals;
using namespace tally;

namespace {

constexpr auto nothing = std::optional<operation_kind>{};
constexpr auto insert = operation_kind::insert;
constexpr auto update = operation_kind::update;
constexpr auto delete_ = operation_kind::delete_;
constexpr auto stale = operation_kind::stale_version;

} // namespace

TEST("merge without a prior operation") {
  CHECK_EQUAL(merge(nothing, lifecycle_event::insert), insert);
  CHECK_EQUAL(merge(nothing, lifecycle_event::update), update);
  CHECK_EQUAL(merge(nothing, lifecycle_event::delete_), delete_);
}

TEST("merge after an insert") {
  CHECK_EQUAL(merge(insert, lifecycle_event::insert), insert);
  CHECK_EQUAL(merge(insert, lifecycle_event::update), insert);
  CHECK_EQUAL(merge(insert, lifecycle_event::delete_), stale);
}

TEST("merge after an update") {
  CHECK_EQUAL(merge(update, lifecycle_event::insert), update);
  CHECK_EQUAL(merge(update, lifecycle_event::update), update);
  CHECK_EQUAL(merge(update, lifecycle_event::delete_), delete_);
}

TEST("merge after a delete") {
  CHECK_EQUAL(merge(delete_, lifecycle_event::insert), update);
  CHECK_EQUAL(merge(delete_, lifecycle_event::update), delete_);
  CHECK_EQUAL(merge(delete_, lifecycle_event::delete_), delete_);
}

TEST("merge after a stale version") {
  CHECK_EQUAL(merge(stale, lifecycle_event::insert), update);
  CHECK_EQUAL(merge(stale, lifecycle_event::update), update);
  CHECK_EQUAL(merge(stale, lifecycle_event::delete_), delete_);
}

TEST("operation kinds keep their numeric values") {
  CHECK_EQUAL(static_cast<int>(stale), -1);
  CHECK_EQUAL(static_cast<int>(insert), 0);
  CHECK_EQUAL(static_cast<int>(update), 1);
  CHECK_EQUAL(static_cast<int>(delete_), 2);
}

TEST("operation equality ignores the processed flag and the target") {
  auto key = entity_key{"user", {int64_t{1}}};
  auto x = operation{key, insert, test::make_user(1)};
  auto y = operation{key, insert};
  y.processed = true;
  CHECK_EQUAL(x, y);
  CHECK_NOT_EQUAL(x, (operation{key, update}));
  CHECK_NOT_EQUAL(x, (operation{entity_key{"user", {int64_t{2}}}, insert}));
}

TEST("operation formatting") {
  auto x = operation{entity_key{"user", {int64_t{1}}}, delete_};
  CHECK_EQUAL(fmt::to_string(x), "delete user(1)");
  x.processed = true;
  CHECK_EQUAL(fmt::to_string(x), "delete user(1) (processed)");
  CHECK_EQUAL(fmt::to_string(stale), "stale_version");
  CHECK_EQUAL(fmt::to_string(lifecycle_event::delete_), "delete");
}
