//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/detail/inspection_common.hpp"
#include "tally/entity_key.hpp"

#include <caf/detail/stringification_inspector.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace tally {

/// The net effect of a unit of work on one entity, as recorded in its
/// version history.
enum class operation_kind : int8_t {
  /// The entity was created and destroyed within the same unit of work. No
  /// version must be persisted.
  stale_version = -1,
  insert = 0,
  update = 1,
  // Unfortunately, `delete` is a reserved keyword. The trailing `_` exists
  // only for disambiguation.
  delete_ = 2,
};

/// @relates operation_kind
auto to_string(operation_kind x) -> std::string_view;

/// @relates operation_kind
template <class Inspector>
auto inspect(Inspector& f, operation_kind& x) {
  return detail::inspect_enum(f, x);
}

/// A raw lifecycle notification for a single entity.
enum class lifecycle_event : uint8_t {
  insert,
  update,
  delete_,
};

/// @relates lifecycle_event
auto to_string(lifecycle_event x) -> std::string_view;

/// @relates lifecycle_event
template <class Inspector>
auto inspect(Inspector& f, lifecycle_event& x) {
  return detail::inspect_enum(f, x);
}

/// Folds a newly observed lifecycle event into the operation recorded so
/// far for the same entity.
///
/// | existing      | insert        | update        | delete        |
/// |---------------|---------------|---------------|---------------|
/// | (none)        | insert        | update        | delete        |
/// | insert        | insert        | insert        | stale_version |
/// | update        | update        | update        | delete        |
/// | delete        | update        | delete        | delete        |
/// | stale_version | insert        | stale_version | stale_version |
///
/// The function is total: every combination yields an operation kind.
/// @param existing The operation kind recorded so far, if any.
/// @param event The new event.
/// @returns the operation kind to record.
auto merge(std::optional<operation_kind> existing, lifecycle_event event)
  -> operation_kind;

/// A finalized operation for one entity.
struct operation {
  operation() = default;

  operation(entity_key key, operation_kind kind, entity_ptr target = nullptr)
    : key{std::move(key)}, kind{kind}, target{std::move(target)} {
  }

  /// The identity of the entity at the time the operation was recorded.
  entity_key key = {};

  /// The net effect on the entity.
  operation_kind kind = operation_kind::insert;

  /// Set by consumers once the operation has been emitted. The ledger never
  /// touches this flag.
  bool processed = false;

  /// The entity the operation was last recorded for, if known.
  entity_ptr target = nullptr;

  /// Two operations are equal if they target the same key with the same
  /// kind. Neither the `processed` flag nor the target pointer participates.
  friend bool operator==(const operation& lhs, const operation& rhs) {
    return lhs.key == rhs.key && lhs.kind == rhs.kind;
  }

  friend auto inspect(caf::detail::stringification_inspector& f,
                      operation& x)
    -> bool {
    auto str = fmt::to_string(x);
    return f(str);
  }
};

} // namespace tally

template <>
struct fmt::formatter<tally::operation_kind>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::operation_kind x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};

template <>
struct fmt::formatter<tally::lifecycle_event>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::lifecycle_event x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};

template <>
struct fmt::formatter<tally::operation> {
  template <class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const tally::operation& x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{} {}{}", x.kind, x.key,
                          x.processed ? " (processed)" : "");
  }
};
