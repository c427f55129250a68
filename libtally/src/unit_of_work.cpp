//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/unit_of_work.hpp"

#include "tally/error.hpp"
#include "tally/logger.hpp"

#include <cstddef>

namespace tally {

void unit_of_work::on_insert(const entity_ptr& x) {
  ledger_.record_insert(x);
}

void unit_of_work::on_update(const entity_ptr& x,
                             std::span<const std::string> changed) {
  ledger_.record_update(x, changed);
}

void unit_of_work::on_delete(const entity_ptr& x) {
  ledger_.record_delete(x);
}

caf::error unit_of_work::flush(version_writer& writer) {
  auto written = size_t{0};
  // The writer may record further operations and thereby grow the ledger,
  // so entries are addressed by position and handed out as copies.
  for (auto i = size_t{0}; i < ledger_.size(); ++i) {
    auto op = (ledger_.begin() + i)->second;
    if (op.processed || op.kind == operation_kind::stale_version)
      continue;
    if (auto err = writer.write(op)) {
      TALLY_WARN("unit of work failed to write {}: {}", op, err);
      return add_context(err, "failed to write {}", op);
    }
    (ledger_.begin() + i)->second.processed = true;
    ++written;
  }
  TALLY_VERBOSE("unit of work flushed {} operations", written);
  return {};
}

void unit_of_work::clear() {
  TALLY_DEBUG("unit of work discards {} operations", ledger_.size());
  ledger_.clear();
}

operation_ledger& unit_of_work::ledger() {
  return ledger_;
}

const operation_ledger& unit_of_work::ledger() const {
  return ledger_;
}

} // namespace tally
