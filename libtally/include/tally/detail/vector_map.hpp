//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tally::detail {

/// A map abstraction over a `std::vector`. The *Policy* decides where new
/// elements go and how lookups scan the underlying vector.
template <class Key, class T, class Allocator, class Policy>
class vector_map {
public:
  // -- types ----------------------------------------------------------------

  using key_type = Key;
  using mapped_type = T;
  using value_type = std::pair<Key, T>;
  using vector_type = std::vector<value_type, Allocator>;
  using allocator_type = typename vector_type::allocator_type;
  using size_type = typename vector_type::size_type;
  using difference_type = typename vector_type::difference_type;
  using reference = typename vector_type::reference;
  using const_reference = typename vector_type::const_reference;
  using pointer = typename vector_type::pointer;
  using const_pointer = typename vector_type::const_pointer;
  using iterator = typename vector_type::iterator;
  using const_iterator = typename vector_type::const_iterator;
  using reverse_iterator = typename vector_type::reverse_iterator;
  using const_reverse_iterator = typename vector_type::const_reverse_iterator;

  // -- construction ---------------------------------------------------------

  vector_map() = default;

  vector_map(std::initializer_list<value_type> l) {
    reserve(l.size());
    for (auto& x : l)
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

  reverse_iterator rbegin() {
    return xs_.rbegin();
  }

  const_reverse_iterator rbegin() const {
    return xs_.rbegin();
  }

  reverse_iterator rend() {
    return xs_.rend();
  }

  const_reverse_iterator rend() const {
    return xs_.rend();
  }

  // -- capacity -------------------------------------------------------------

  [[nodiscard]] bool empty() const {
    return xs_.empty();
  }

  [[nodiscard]] size_type size() const {
    return xs_.size();
  }

  void reserve(size_type count) {
    xs_.reserve(count);
  }

  // -- modifiers ------------------------------------------------------------

  void clear() {
    xs_.clear();
  }

  std::pair<iterator, bool> insert(value_type x) {
    return Policy::add(xs_, std::move(x));
  }

  template <class... Ts>
  std::pair<iterator, bool> emplace(Ts&&... xs) {
    return insert(value_type(std::forward<Ts>(xs)...));
  }

  /// Inserts a new element or overwrites the mapped value of an existing
  /// element in place.
  template <class M>
  std::pair<iterator, bool> insert_or_assign(const key_type& key, M&& x) {
    auto i = find(key);
    if (i == end())
      return insert(value_type{key, std::forward<M>(x)});
    i->second = std::forward<M>(x);
    return {i, false};
  }

  iterator erase(const_iterator i) {
    return xs_.erase(i);
  }

  size_type erase(const key_type& x) {
    auto i = find(x);
    if (i == end())
      return 0;
    erase(i);
    return 1;
  }

  // -- lookup ---------------------------------------------------------------

  mapped_type& at(const key_type& key) {
    auto i = find(key);
    if (i == end())
      throw std::out_of_range{"tally::detail::vector_map::at out of range"};
    return i->second;
  }

  const mapped_type& at(const key_type& key) const {
    auto i = find(key);
    if (i == end())
      throw std::out_of_range{"tally::detail::vector_map::at out of range"};
    return i->second;
  }

  mapped_type& operator[](const key_type& key) {
    return insert(value_type{key, mapped_type{}}).first->second;
  }

  template <class L>
  iterator find(const L& x) {
    return Policy::lookup(xs_, x);
  }

  template <class L>
  const_iterator find(const L& x) const {
    return Policy::lookup(xs_, x);
  }

  template <class L>
  size_type count(const L& x) const {
    return contains(x) ? 1 : 0;
  }

  template <class L>
  bool contains(const L& x) const {
    return find(x) != end();
  }

  // -- operators ------------------------------------------------------------

  friend bool operator==(const vector_map& lhs, const vector_map& rhs) {
    return lhs.xs_ == rhs.xs_;
  }

  // -- accessors ------------------------------------------------------------

  friend vector_type& as_vector(vector_map& xs) {
    return xs.xs_;
  }

  friend const vector_type& as_vector(const vector_map& xs) {
    return xs.xs_;
  }

private:
  vector_type xs_;
};

} // namespace tally::detail
