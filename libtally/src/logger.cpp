//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/logger.hpp"

#include "tally/defaults.hpp"
#include "tally/detail/assert.hpp"

#include <caf/config_value.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>
#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <vector>

namespace tally {

caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg) {
  for (const auto* key : {"tally.console-verbosity", "tally.file-verbosity"}) {
    if (auto value = caf::get_if<std::string>(&cfg, key);
        value && loglevel_to_int(*value, -1) < 0)
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("{} '{}' is invalid", key, *value));
  }
  if (auto console = caf::get_or(cfg, "tally.console",
                                 std::string{defaults::logger::console});
      console != "automatic" && console != "always" && console != "never")
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("tally.console '{}' is invalid "
                                       "(expected 'automatic', 'always', or "
                                       "'never')",
                                       console));
  if (not detail::setup_spdlog(cfg))
    return caf::make_error(ec::unspecified, "failed to start logger");
  return {caf::detail::make_scope_guard(
    std::addressof(tally::detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
int loglevel_to_int(std::string x, int default_value) {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return TALLY_LOG_LEVEL_QUIET;
  if (x == "critical")
    return TALLY_LOG_LEVEL_CRITICAL;
  if (x == "error")
    return TALLY_LOG_LEVEL_ERROR;
  if (x == "warning")
    return TALLY_LOG_LEVEL_WARNING;
  if (x == "info")
    return TALLY_LOG_LEVEL_INFO;
  if (x == "verbose")
    return TALLY_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return TALLY_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return TALLY_LOG_LEVEL_TRACE;
  return default_value;
}

namespace {

/// Converts a tally log level to spdlog level
spdlog::level::level_enum tally_loglevel_to_spd(const int value) {
  spdlog::level::level_enum level = spdlog::level::off;
  switch (value) {
    case TALLY_LOG_LEVEL_QUIET:
      break;
    case TALLY_LOG_LEVEL_CRITICAL:
      level = spdlog::level::critical;
      break;
    case TALLY_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case TALLY_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case TALLY_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case TALLY_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case TALLY_LOG_LEVEL_DEBUG:
      level = spdlog::level::trace;
      break;
    case TALLY_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
    default:
      TALLY_ASSERT(false, "unhandled log level");
  }
  return level;
}

} // namespace

namespace detail {

bool setup_spdlog(const caf::settings& cfg) try {
  if (logger()->name() != "/dev/null") {
    TALLY_ERROR("Log already up");
    return false;
  }
  auto console_verbosity
    = loglevel_to_int(caf::get_or(cfg, "tally.console-verbosity",
                                  std::string{
                                    defaults::logger::console_verbosity}));
  auto log_file = caf::get_or(cfg, "tally.log-file",
                              std::string{defaults::logger::log_file});
  // Without a log file there is nothing to configure a file verbosity for.
  auto file_verbosity
    = log_file.empty()
        ? TALLY_LOG_LEVEL_QUIET
        : loglevel_to_int(caf::get_or(cfg, "tally.file-verbosity",
                                      std::string{
                                        defaults::logger::file_verbosity}));
  auto verbosity = std::max(file_verbosity, console_verbosity);
  spdlog::color_mode log_color = [&]() -> spdlog::color_mode {
    auto config_value = caf::get_or(cfg, "tally.console",
                                    std::string{defaults::logger::console});
    if (config_value == "automatic")
      return spdlog::color_mode::automatic;
    if (config_value == "always")
      return spdlog::color_mode::always;
    return spdlog::color_mode::never;
  }();
  spdlog::init_thread_pool(defaults::logger::queue_size,
                           defaults::logger::logger_threads);
  std::vector<spdlog::sink_ptr> sinks;
  // Add console sink.
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(log_color);
  console_sink->set_pattern(
    caf::get_or(cfg, "tally.console-format",
                std::string{defaults::logger::console_format}));
  console_sink->set_level(tally_loglevel_to_spd(console_verbosity));
  sinks.push_back(console_sink);
  // Add file sink.
  if (file_verbosity != TALLY_LOG_LEVEL_QUIET) {
    auto file_sink
      = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    file_sink->set_pattern(
      caf::get_or(cfg, "tally.file-format",
                  std::string{defaults::logger::file_format}));
    file_sink->set_level(tally_loglevel_to_spd(file_verbosity));
    sinks.push_back(file_sink);
  }
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::async_logger>(
    "tally", sinks.begin(), sinks.end(), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  logger()->set_level(tally_loglevel_to_spd(verbosity));
  spdlog::register_logger(logger());
  return true;
} catch (const spdlog::spdlog_ex& err) {
  std::cerr << err.what() << "\n";
  return false;
}

void shutdown_spdlog() {
  TALLY_DEBUG("shut down logging");
  spdlog::shutdown();
  logger() = spdlog::null_logger_mt("/dev/null");
}

std::shared_ptr<spdlog::logger>& logger() {
  static std::shared_ptr<spdlog::logger> tally_logger
    = spdlog::null_logger_mt("/dev/null");
  return tally_logger;
}

} // namespace detail
} // namespace tally
