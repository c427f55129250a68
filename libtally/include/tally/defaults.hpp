//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include <cstddef>
#include <string_view>

namespace tally::defaults {

// -- constants for the logger -------------------------------------------------

namespace logger {

/// Verbosity of the console sink.
inline constexpr std::string_view console_verbosity = "info";

/// Verbosity of the file sink.
inline constexpr std::string_view file_verbosity = "debug";

/// Color mode of the console sink.
inline constexpr std::string_view console = "automatic";

/// Path of the log file. An empty path disables file logging.
inline constexpr std::string_view log_file = "";

/// Format string for console output.
inline constexpr std::string_view console_format = "%^[%T.%e] %v%$";

/// Format string for file output.
inline constexpr std::string_view file_format
  = "[%Y-%m-%dT%T.%e%z] [%n] [%l] [%s:%#] %v";

/// Capacity of the message queue of the asynchronous logger.
inline constexpr size_t queue_size = 8'192;

/// Number of background threads of the asynchronous logger.
inline constexpr size_t logger_threads = 1;

} // namespace logger

} // namespace tally::defaults
