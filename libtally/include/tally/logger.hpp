//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/config.hpp"
#include "tally/detail/discard.hpp"
#include "tally/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/fwd.hpp>

#include <string>

// Below info, VERBOSE maps to spdlog's debug while DEBUG and TRACE both map to
// spdlog's trace.
#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#else
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

#include "tally/detail/logger.hpp"

#define TALLY_LOG_WITH(spdlog_macro, ...)                                      \
  spdlog_macro(::tally::detail::logger(), __VA_ARGS__)

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_TRACE
#  define TALLY_TRACE(...) TALLY_LOG_WITH(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#else
#  define TALLY_TRACE(...) TALLY_DISCARD_ARGS(__VA_ARGS__)
#endif

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_DEBUG
#  define TALLY_DEBUG(...) TALLY_LOG_WITH(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#else
#  define TALLY_DEBUG(...) TALLY_DISCARD_ARGS(__VA_ARGS__)
#endif

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_VERBOSE
#  define TALLY_VERBOSE(...) TALLY_LOG_WITH(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#else
#  define TALLY_VERBOSE(...) TALLY_DISCARD_ARGS(__VA_ARGS__)
#endif

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_WARNING
#  define TALLY_WARN(...) TALLY_LOG_WITH(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#else
#  define TALLY_WARN(...) TALLY_DISCARD_ARGS(__VA_ARGS__)
#endif

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_ERROR
#  define TALLY_ERROR(...) TALLY_LOG_WITH(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#else
#  define TALLY_ERROR(...) TALLY_DISCARD_ARGS(__VA_ARGS__)
#endif

namespace tally {

/// Maps a verbosity name such as `info` or `trace` to its `TALLY_LOG_LEVEL_*`
/// value, or to `default_value` for unknown names.
int loglevel_to_int(std::string x, int default_value = TALLY_LOG_LEVEL_QUIET);

/// Starts the global logger from the `tally.*` keys in `cfg`. The returned
/// guard shuts it down again.
[[nodiscard]] caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg);

} // namespace tally
