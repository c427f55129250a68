//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/entity.hpp"

#include <caf/detail/stringification_inspector.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <optional>
#include <string>

namespace tally {

/// The identity of an entity within a unit of work: its type name plus the
/// values of its primary-key columns. Two keys are equal if and only if
/// both the type and all primary-key values compare equal element-wise.
struct entity_key {
  std::string type = {};
  key_tuple primary_key = {};

  /// Compares type and components. Floating-point components compare NaN
  /// equal to NaN, so that an entity keyed by NaN keeps a single identity.
  friend bool operator==(const entity_key& lhs, const entity_key& rhs);

  friend auto inspect(caf::detail::stringification_inspector& f,
                      entity_key& x)
    -> bool {
    auto str = fmt::to_string(x);
    return f(str);
  }
};

/// Computes the key of an entity from its *current* primary-key values.
/// @relates entity_key
auto key_of(const entity& x) -> entity_key;

/// Computes the key under which an entity was last persisted, or
/// `std::nullopt` if it was never persisted.
/// @relates entity_key
auto persisted_key_of(const entity& x) -> std::optional<entity_key>;

/// @relates entity_key
auto hash(const entity_key& x) -> size_t;

} // namespace tally

namespace std {

template <>
struct hash<tally::entity_key> {
  size_t operator()(const tally::entity_key& x) const {
    return tally::hash(x);
  }
};

} // namespace std

template <>
struct fmt::formatter<tally::entity_key> {
  template <class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  // e.g. user(42) or membership("alice", 7)
  template <class FormatContext>
  auto format(const tally::entity_key& x, FormatContext& ctx) const {
    auto out = fmt::format_to(ctx.out(), "{}(", x.type);
    auto first = true;
    for (const auto& component : x.primary_key) {
      if (not first)
        out = fmt::format_to(out, ", ");
      out = fmt::format_to(out, "{}", component);
      first = false;
    }
    return fmt::format_to(out, ")");
  }
};
