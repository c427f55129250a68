//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <tsl/robin_map.h>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tally::detail {

/// An insertion-ordered map. Entries live in a `std::vector`, and a hash
/// index maps every key to its position for constant-time lookup.
///
/// Assigning to an existing key keeps its position. Erasing shifts all later
/// entries to the front, so an erased key that gets inserted again lands at
/// the end.
template <class Key, class T, class Hash = std::hash<Key>>
class indexed_map {
public:
  // -- types ----------------------------------------------------------------

  using key_type = Key;
  using mapped_type = T;
  using value_type = std::pair<Key, T>;
  using vector_type = std::vector<value_type>;
  using size_type = typename vector_type::size_type;
  using iterator = typename vector_type::iterator;
  using const_iterator = typename vector_type::const_iterator;

  // -- construction ---------------------------------------------------------

  indexed_map() = default;

  indexed_map(std::initializer_list<value_type> xs) {
    for (auto& x : xs)
      insert(x);
  }

  // -- iterators ------------------------------------------------------------

  iterator begin() {
    return xs_.begin();
  }

  const_iterator begin() const {
    return xs_.begin();
  }

  iterator end() {
    return xs_.end();
  }

  const_iterator end() const {
    return xs_.end();
  }

  // -- capacity -------------------------------------------------------------

  [[nodiscard]] bool empty() const {
    return xs_.empty();
  }

  [[nodiscard]] size_type size() const {
    return xs_.size();
  }

  // -- modifiers ------------------------------------------------------------

  void clear() {
    xs_.clear();
    index_.clear();
  }

  /// Appends `x` unless its key already exists.
  std::pair<iterator, bool> insert(value_type x) {
    auto [i, inserted] = index_.try_emplace(x.first, xs_.size());
    if (not inserted)
      return {begin() + i->second, false};
    xs_.push_back(std::move(x));
    return {std::prev(end()), true};
  }

  template <class M>
  std::pair<iterator, bool> insert_or_assign(const key_type& key, M&& x) {
    if (auto i = find(key); i != end()) {
      i->second = std::forward<M>(x);
      return {i, false};
    }
    return insert(value_type{key, std::forward<M>(x)});
  }

  iterator erase(const_iterator i) {
    const auto position = static_cast<size_t>(i - xs_.cbegin());
    index_.erase(i->first);
    for (auto j = index_.begin(); j != index_.end(); ++j)
      if (j->second > position)
        --j.value();
    return xs_.erase(i);
  }

  size_type erase(const key_type& key) {
    auto i = find(key);
    if (i == end())
      return 0;
    erase(i);
    return 1;
  }

  // -- lookup ---------------------------------------------------------------

  iterator find(const key_type& key) {
    auto i = index_.find(key);
    return i == index_.end() ? end() : begin() + i->second;
  }

  const_iterator find(const key_type& key) const {
    auto i = index_.find(key);
    return i == index_.end() ? end() : begin() + i->second;
  }

  [[nodiscard]] bool contains(const key_type& key) const {
    return index_.count(key) != 0;
  }

  mapped_type& at(const key_type& key) {
    auto i = find(key);
    if (i == end())
      throw std::out_of_range{"tally::detail::indexed_map::at out of range"};
    return i->second;
  }

  const mapped_type& at(const key_type& key) const {
    auto i = find(key);
    if (i == end())
      throw std::out_of_range{"tally::detail::indexed_map::at out of range"};
    return i->second;
  }

  // -- operators ------------------------------------------------------------

  friend bool operator==(const indexed_map& lhs, const indexed_map& rhs) {
    return lhs.xs_ == rhs.xs_;
  }

private:
  vector_type xs_;
  tsl::robin_map<Key, size_t, Hash> index_;
};

} // namespace tally::detail
