//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/operation.hpp"

#include "tally/detail/assert.hpp"

namespace tally {

auto to_string(operation_kind x) -> std::string_view {
  switch (x) {
    case operation_kind::stale_version:
      return "stale_version";
    case operation_kind::insert:
      return "insert";
    case operation_kind::update:
      return "update";
    case operation_kind::delete_:
      return "delete";
  }
  TALLY_UNREACHABLE();
}

auto to_string(lifecycle_event x) -> std::string_view {
  switch (x) {
    case lifecycle_event::insert:
      return "insert";
    case lifecycle_event::update:
      return "update";
    case lifecycle_event::delete_:
      return "delete";
  }
  TALLY_UNREACHABLE();
}

auto merge(std::optional<operation_kind> existing, lifecycle_event event)
  -> operation_kind {
  if (not existing) {
    switch (event) {
      case lifecycle_event::insert:
        return operation_kind::insert;
      case lifecycle_event::update:
        return operation_kind::update;
      case lifecycle_event::delete_:
        return operation_kind::delete_;
    }
    TALLY_UNREACHABLE();
  }
  switch (*existing) {
    case operation_kind::insert:
      // The entity never existed outside of this unit of work, so updates
      // keep it an insert and a delete drops it entirely.
      return event == lifecycle_event::delete_ ? operation_kind::stale_version
                                               : operation_kind::insert;
    case operation_kind::update:
      return event == lifecycle_event::delete_ ? operation_kind::delete_
                                               : operation_kind::update;
    case operation_kind::delete_:
      // A new entity took over the identity of the deleted one.
      return event == lifecycle_event::insert ? operation_kind::update
                                              : operation_kind::delete_;
    case operation_kind::stale_version:
      // A stale entry still occupies the key, so only inserts get promoted.
      return event == lifecycle_event::delete_ ? operation_kind::delete_
                                               : operation_kind::update;
  }
  TALLY_UNREACHABLE();
}

} // namespace tally
