//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <type_traits>

namespace tally::detail {

/// Inspects an enum through its underlying integral type.
template <class Inspector, class Enum>
  requires std::is_enum_v<Enum>
auto inspect_enum(Inspector& f, Enum& x) -> bool {
  using underlying_type = std::underlying_type_t<Enum>;
  if constexpr (Inspector::is_loading) {
    auto tmp = underlying_type{};
    if (not f.apply(tmp))
      return false;
    x = static_cast<Enum>(tmp);
    return true;
  } else {
    auto tmp = static_cast<underlying_type>(x);
    return f.apply(tmp);
  }
}

} // namespace tally::detail
