//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace tally::detail {

template <class... Ts>
constexpr int discard_args(const Ts&...) {
  return 0;
}

} // namespace tally::detail

/// Swallows its arguments without evaluating them, so that disabled log
/// statements neither cost anything nor leave variables unused.
#define TALLY_DISCARD_ARGS(...)                                                \
  static_cast<void>(sizeof(::tally::detail::discard_args(__VA_ARGS__)))
