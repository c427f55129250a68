//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/detail/vector_map.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace tally::detail {

/// Appends new elements and scans linearly on lookup, so that iteration
/// yields elements in the order they were first inserted.
struct stable_map_policy {
  template <class Ts, class T>
  static auto add(Ts& xs, T&& x) {
    auto i = lookup(xs, x.first);
    if (i == xs.end()) {
      xs.push_back(std::forward<T>(x));
      return std::make_pair(std::prev(xs.end()), true);
    }
    return std::make_pair(i, false);
  }

  template <class Ts, class Key>
  static auto lookup(Ts&& xs, const Key& x) {
    return std::find_if(xs.begin(), xs.end(), [&](const auto& y) {
      return y.first == x;
    });
  }
};

} // namespace tally::detail
