//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/operation_ledger.hpp"

#include "tally/detail/assert.hpp"
#include "tally/error.hpp"
#include "tally/logger.hpp"

#include <optional>
#include <utility>

namespace tally {

void operation_ledger::record_insert(const entity_ptr& x) {
  TALLY_ASSERT(x != nullptr);
  apply(x, lifecycle_event::insert);
}

void operation_ledger::record_update(const entity_ptr& x,
                                     std::span<const std::string> changed) {
  TALLY_ASSERT(x != nullptr);
  const auto& schema = x->schema();
  auto relevant = false;
  auto primary_key_changed = false;
  for (const auto& attribute : changed) {
    auto kind = schema.classify(attribute);
    if (is_collection(kind))
      continue;
    relevant = true;
    if (kind == attribute_kind::primary_key)
      primary_key_changed = true;
  }
  if (not relevant) {
    TALLY_TRACE("ledger ignores update of {} without relevant changes",
                key_of(*x));
    return;
  }
  if (primary_key_changed)
    rekey(*x);
  apply(x, lifecycle_event::update);
}

void operation_ledger::record_delete(const entity_ptr& x) {
  TALLY_ASSERT(x != nullptr);
  apply(x, lifecycle_event::delete_);
}

void operation_ledger::add(operation op) {
  auto key = op.key;
  insert_or_assign(key, std::move(op));
}

bool operation_ledger::contains(const entity_key& key) const {
  return operations_.contains(key);
}

bool operation_ledger::contains(const entity& x) const {
  return contains(key_of(x));
}

operation_ledger::iterator operation_ledger::find(const entity_key& key) {
  return operations_.find(key);
}

operation_ledger::const_iterator
operation_ledger::find(const entity_key& key) const {
  return operations_.find(key);
}

operation& operation_ledger::at(const entity_key& key) {
  return operations_.at(key);
}

const operation& operation_ledger::at(const entity_key& key) const {
  return operations_.at(key);
}

void operation_ledger::insert_or_assign(const entity_key& key, operation op) {
  operations_.insert_or_assign(key, std::move(op));
}

caf::error operation_ledger::erase(const entity_key& key) {
  if (operations_.erase(key) == 0)
    return caf::make_error(ec::lookup_error,
                           fmt::format("no operation recorded for {}", key));
  return {};
}

void operation_ledger::clear() {
  operations_.clear();
}

bool operation_ledger::empty() const {
  return operations_.empty();
}

operation_ledger::size_type operation_ledger::size() const {
  return operations_.size();
}

operation_ledger::operator bool() const {
  return not empty();
}

operation_ledger::iterator operation_ledger::begin() {
  return operations_.begin();
}

operation_ledger::const_iterator operation_ledger::begin() const {
  return operations_.begin();
}

operation_ledger::iterator operation_ledger::end() {
  return operations_.end();
}

operation_ledger::const_iterator operation_ledger::end() const {
  return operations_.end();
}

std::vector<operation> operation_ledger::finalized_operations() const {
  auto result = std::vector<operation>{};
  result.reserve(operations_.size());
  for (const auto& [key, op] : operations_)
    if (op.kind != operation_kind::stale_version)
      result.push_back(op);
  return result;
}

std::set<std::string> operation_ledger::entity_types() const {
  auto result = std::set<std::string>{};
  for (const auto& [key, op] : operations_)
    result.insert(key.type);
  return result;
}

std::set<std::string> operation_ledger::changed_entity_types() const {
  auto result = std::set<std::string>{};
  for (const auto& [key, op] : operations_)
    if (op.kind != operation_kind::stale_version)
      result.insert(key.type);
  return result;
}

void operation_ledger::rekey(const entity& x) {
  auto old_key = persisted_key_of(x);
  if (not old_key)
    return;
  auto i = operations_.find(*old_key);
  if (i == operations_.end())
    return;
  auto new_key = key_of(x);
  TALLY_DEBUG("ledger moves {} from {} to {}", i->second.kind, *old_key,
              new_key);
  auto op = std::move(i->second);
  operations_.erase(i);
  op.key = new_key;
  // The entry moves to the end, unless the new key is already taken.
  operations_.insert_or_assign(new_key, std::move(op));
}

void operation_ledger::apply(const entity_ptr& x, lifecycle_event event) {
  auto key = key_of(*x);
  auto i = operations_.find(key);
  auto existing = i != operations_.end()
                    ? std::optional<operation_kind>{i->second.kind}
                    : std::nullopt;
  auto kind = merge(existing, event);
  TALLY_DEBUG("ledger merges {} of {} into {}: {}", event, key,
              existing ? to_string(*existing) : "nothing", kind);
  if (i == operations_.end()) {
    auto op = operation{key, kind, x};
    operations_.insert({std::move(key), std::move(op)});
    return;
  }
  i->second = operation{std::move(key), kind, x};
}

} // namespace tally
