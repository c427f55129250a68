//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/detail/stable_map.hpp"

#include <caf/none.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tally {

/// A single primary-key column value. `caf::none` denotes a NULL column.
using key_component
  = std::variant<caf::none_t, bool, int64_t, uint64_t, double, std::string>;

/// The values of all primary-key columns of an entity, in column order.
using key_tuple = std::vector<key_component>;

/// The role an attribute plays in the mapping of an entity type.
enum class attribute_kind : uint8_t {
  /// A plain column.
  column,
  /// A column that is part of the primary key.
  primary_key,
  /// A reference to a single related entity.
  many_to_one,
  /// A collection of related entities that reference this one.
  one_to_many,
  /// A collection of related entities linked through an association table.
  many_to_many,
};

/// @relates attribute_kind
auto to_string(attribute_kind x) -> std::string_view;

/// Returns whether a change of an attribute of the given kind is recorded on
/// the other side of the relationship.
auto is_collection(attribute_kind x) -> bool;

/// Describes the attributes of one entity type.
class entity_schema {
public:
  virtual ~entity_schema() noexcept = default;

  /// The name of the entity type.
  [[nodiscard]] virtual auto name() const -> std::string_view = 0;

  /// Classifies an attribute of the entity type by name.
  [[nodiscard]] virtual auto classify(std::string_view attribute) const
    -> attribute_kind
    = 0;
};

/// An entity schema with a fixed attribute table. Attributes missing from
/// the table classify as plain columns.
class static_schema final : public entity_schema {
public:
  static_schema(std::string name,
                std::vector<std::pair<std::string, attribute_kind>> attributes);

  [[nodiscard]] auto name() const -> std::string_view override;

  [[nodiscard]] auto classify(std::string_view attribute) const
    -> attribute_kind override;

private:
  std::string name_;
  detail::stable_map<std::string, attribute_kind> attributes_;
};

/// An object whose lifecycle is tracked within a unit of work.
class entity {
public:
  virtual ~entity() noexcept = default;

  /// The schema of the entity type.
  [[nodiscard]] virtual auto schema() const -> const entity_schema& = 0;

  /// The current primary-key values. Must be callable at any time, even
  /// before the entity has been persisted.
  [[nodiscard]] virtual auto primary_key() const -> key_tuple = 0;

  /// The primary-key values under which the entity was last persisted, or
  /// `std::nullopt` if it was never persisted.
  [[nodiscard]] virtual auto persisted_primary_key() const
    -> std::optional<key_tuple>
    = 0;
};

} // namespace tally

template <>
struct fmt::formatter<tally::key_component> {
  template <class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const tally::key_component& x, FormatContext& ctx) const {
    auto f = [&]<class T>(const T& value) {
      if constexpr (std::is_same_v<T, caf::none_t>)
        return fmt::format_to(ctx.out(), "null");
      else if constexpr (std::is_same_v<T, std::string>)
        return fmt::format_to(ctx.out(), "\"{}\"", value);
      else
        return fmt::format_to(ctx.out(), "{}", value);
    };
    return std::visit(f, x);
  }
};

template <>
struct fmt::formatter<tally::attribute_kind> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::attribute_kind x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(x), ctx);
  }
};
