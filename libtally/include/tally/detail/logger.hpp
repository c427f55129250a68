//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/fwd.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace tally::detail {

/// Returns the global logger. Until `create_log_context` installs a real
/// one, this is a logger that discards everything.
std::shared_ptr<spdlog::logger>& logger();

bool setup_spdlog(const caf::settings& cfg);

void shutdown_spdlog();

} // namespace tally::detail
