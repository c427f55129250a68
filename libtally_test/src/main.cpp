//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/error.hpp"
#include "tally/fwd.hpp"
#include "tally/logger.hpp"

#include <caf/config_option_set.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace {

/// Options for libtally itself follow a `--` on the command line; everything
/// before belongs to the CAF test runner.
auto tally_args(int argc, char** argv) -> std::vector<std::string> {
  auto first = argv + 1;
  auto last = argv + argc;
  auto delimiter = std::find(first, last, std::string_view{"--"});
  if (delimiter == last)
    return {};
  return {delimiter + 1, last};
}

} // namespace

int main(int argc, char** argv) {
  auto verbosity = std::string{"quiet"};
  if (auto args = tally_args(argc, argv); not args.empty()) {
    auto options = caf::config_option_set{}
                     .add(verbosity, "tally-verbosity",
                          "console verbosity of libtally")
                     .add<bool>("help", "print this help text");
    auto cfg = caf::settings{};
    auto [code, pos] = options.parse(cfg, args);
    if (code != caf::pec::success) {
      fmt::print(stderr, "invalid argument '{}': {}\n\n{}\n", *pos,
                 to_string(code), options.help_text());
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      fmt::print("{}\n", options.help_text());
      return 0;
    }
  }
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::tally_types>();
  auto log_settings = caf::settings{};
  caf::put(log_settings, "tally.console-verbosity", verbosity);
  caf::put(log_settings, "tally.console-format", "%^[%s:%#] %v%$");
  auto log_context = tally::create_log_context(log_settings);
  if (not log_context) {
    fmt::print(stderr, "failed to set up logging: {}\n", log_context.error());
    return 1;
  }
  return caf::test::main(argc, argv);
}
