//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/detail/indexed_map.hpp"
#include "tally/entity.hpp"
#include "tally/entity_key.hpp"
#include "tally/operation.hpp"

#include <caf/error.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace tally {

/// Collapses the raw lifecycle events of one unit of work into a single
/// operation per entity.
///
/// The ledger maps entity keys to operations and remembers the order in
/// which keys were first recorded. Overwriting the operation of a key keeps
/// its position. Re-keying an entry after a primary-key change moves it to
/// the position of the new key, which is the end unless the new key was
/// already present.
///
/// A ledger belongs to exactly one unit of work and is not thread-safe.
class operation_ledger {
public:
  using map_type = detail::indexed_map<entity_key, operation>;
  using value_type = map_type::value_type;
  using iterator = map_type::iterator;
  using const_iterator = map_type::const_iterator;
  using size_type = map_type::size_type;

  // -- recording ------------------------------------------------------------

  /// Records that `x` was inserted.
  void record_insert(const entity_ptr& x);

  /// Records that the attributes `changed` of `x` were modified.
  ///
  /// Changes to one-to-many and many-to-many relationships are ignored, as
  /// they are recorded on the other side of the relationship. If no other
  /// change remains, the call does nothing. If a primary-key column changed,
  /// the entry recorded under the previously persisted key of `x` moves to
  /// the current key before the merge.
  void record_update(const entity_ptr& x, std::span<const std::string> changed);

  /// Records that `x` was deleted.
  void record_delete(const entity_ptr& x);

  /// Stores `op` under its key, replacing any operation recorded there.
  void add(operation op);

  // -- lookup ---------------------------------------------------------------

  [[nodiscard]] bool contains(const entity_key& key) const;

  /// Checks whether an operation is recorded under the current key of `x`.
  [[nodiscard]] bool contains(const entity& x) const;

  [[nodiscard]] iterator find(const entity_key& key);

  [[nodiscard]] const_iterator find(const entity_key& key) const;

  /// Accesses the operation recorded under `key`.
  /// @throws std::out_of_range if there is none.
  operation& at(const entity_key& key);

  /// @copydoc at
  [[nodiscard]] const operation& at(const entity_key& key) const;

  // -- modifiers ------------------------------------------------------------

  /// Stores `op` under `key`. An existing entry keeps its position.
  void insert_or_assign(const entity_key& key, operation op);

  /// Removes the operation recorded under `key`.
  /// @returns `ec::lookup_error` if no operation is recorded under `key`.
  [[nodiscard]] caf::error erase(const entity_key& key);

  /// Discards all recorded operations.
  void clear();

  // -- properties -----------------------------------------------------------

  [[nodiscard]] bool empty() const;

  [[nodiscard]] size_type size() const;

  explicit operator bool() const;

  // -- iteration ------------------------------------------------------------

  [[nodiscard]] iterator begin();

  [[nodiscard]] const_iterator begin() const;

  [[nodiscard]] iterator end();

  [[nodiscard]] const_iterator end() const;

  // -- derived views --------------------------------------------------------

  /// @returns the operations to persist in recording order, omitting stale
  /// versions.
  [[nodiscard]] std::vector<operation> finalized_operations() const;

  /// @returns the distinct entity types of all recorded keys, including keys
  /// whose operation is a stale version.
  [[nodiscard]] std::set<std::string> entity_types() const;

  /// @returns the distinct entity types of all keys whose operation is not a
  /// stale version.
  [[nodiscard]] std::set<std::string> changed_entity_types() const;

private:
  /// Moves the entry recorded under the previously persisted key of `x` to
  /// its current key.
  void rekey(const entity& x);

  /// Applies `event` to the entry of `x` and stores the result.
  void apply(const entity_ptr& x, lifecycle_event event);

  map_type operations_;
};

} // namespace tally

template <>
struct fmt::formatter<tally::operation_ledger> {
  template <class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const tally::operation_ledger& x, FormatContext& ctx) const {
    auto out = fmt::format_to(ctx.out(), "[");
    auto first = true;
    for (const auto& [key, op] : x) {
      if (not first)
        out = fmt::format_to(out, ", ");
      out = fmt::format_to(out, "{}", op);
      first = false;
    }
    return fmt::format_to(out, "]");
  }
};
