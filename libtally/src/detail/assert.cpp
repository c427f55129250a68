//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/detail/assert.hpp"

#include "tally/config.hpp"
#include "tally/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <utility>

namespace tally::detail {

namespace {

/// Checks whether `TALLY_ABORT_ON_PANIC` asks to terminate instead of
/// throwing.
bool abort_on_panic() {
  const auto* value = std::getenv("TALLY_ABORT_ON_PANIC");
  return value != nullptr && std::string_view{value} != ""
         && std::string_view{value} != "0";
}

} // namespace

void panic_impl(std::string message, std::source_location source) {
  message += fmt::format(" @ {}:{}", source.file_name(), source.line());
  TALLY_ERROR("panic in tally {}: {}", version::version, message);
  if (abort_on_panic()) {
    // spdlog writes asynchronously.
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    std::_Exit(1);
  }
  throw std::runtime_error(std::move(message));
}

void fail_assertion_impl(const char* expr, std::string_view explanation,
                         std::source_location source) {
  auto message = explanation.empty()
                   ? fmt::format("assertion `{}` failed", expr)
                   : fmt::format("assertion `{}` failed: {}", expr,
                                 explanation);
  panic_impl(std::move(message), source);
}

} // namespace tally::detail
