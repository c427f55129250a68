//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/config.hpp"

#include <source_location>
#include <string>
#include <string_view>

namespace tally::detail {

/// Logs the message and throws, or terminates the process when the
/// environment variable `TALLY_ABORT_ON_PANIC` is set to a non-zero value.
[[noreturn]] TALLY_NO_INLINE void
panic_impl(std::string message,
           std::source_location source = std::source_location::current());

[[noreturn]] TALLY_NO_INLINE void
fail_assertion_impl(const char* expr, std::string_view explanation = {},
                    std::source_location source
                    = std::source_location::current());

} // namespace tally::detail

/// Checks an internal invariant. Unlike `assert`, the check is always active.
#define TALLY_ASSERT(expr, ...)                                                \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::tally::detail::fail_assertion_impl(#expr __VA_OPT__(, ) __VA_ARGS__);  \
    }                                                                          \
  } while (false)

/// Marks a code path that must never execute.
#define TALLY_UNREACHABLE()                                                    \
  ::tally::detail::panic_impl("unreachable code path reached")
