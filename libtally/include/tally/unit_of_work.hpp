//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/operation.hpp"
#include "tally/operation_ledger.hpp"

#include <caf/error.hpp>

#include <span>
#include <string>

namespace tally {

/// Receives the finalized operations of a unit of work, e.g., to write rows
/// into a version table.
class version_writer {
public:
  virtual ~version_writer() noexcept = default;

  /// Persists a single operation.
  /// @returns an error if the operation could not be persisted.
  virtual caf::error write(const operation& op) = 0;
};

/// The scope across which lifecycle events for the same entity collapse into
/// one operation. A unit of work owns exactly one ledger.
class unit_of_work {
public:
  unit_of_work() = default;
  unit_of_work(const unit_of_work&) = delete;
  unit_of_work& operator=(const unit_of_work&) = delete;
  unit_of_work(unit_of_work&&) = default;
  unit_of_work& operator=(unit_of_work&&) = default;
  ~unit_of_work() noexcept = default;

  // -- lifecycle notifications ----------------------------------------------

  void on_insert(const entity_ptr& x);

  void on_update(const entity_ptr& x, std::span<const std::string> changed);

  void on_delete(const entity_ptr& x);

  // -- flushing -------------------------------------------------------------

  /// Hands all finalized operations that were not yet processed to `writer`
  /// in recording order and marks them as processed.
  /// Operations that `writer` records while being called get written by the
  /// same flush. `writer` must not erase recorded operations.
  /// @returns the first error of `writer`. Operations written before the
  /// failure stay processed, later ones do not.
  caf::error flush(version_writer& writer);

  /// Discards all recorded operations, e.g., on rollback.
  void clear();

  // -- accessors ------------------------------------------------------------

  [[nodiscard]] operation_ledger& ledger();

  [[nodiscard]] const operation_ledger& ledger() const;

private:
  operation_ledger ledger_;
};

} // namespace tally
