//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/entity_key.hpp"

#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <type_traits>
#include <variant>

namespace tally {

auto key_of(const entity& x) -> entity_key {
  return {
    .type = std::string{x.schema().name()},
    .primary_key = x.primary_key(),
  };
}

auto persisted_key_of(const entity& x) -> std::optional<entity_key> {
  auto primary_key = x.persisted_primary_key();
  if (not primary_key)
    return std::nullopt;
  return entity_key{
    .type = std::string{x.schema().name()},
    .primary_key = std::move(*primary_key),
  };
}

bool operator==(const entity_key& lhs, const entity_key& rhs) {
  auto same = [](const key_component& x, const key_component& y) {
    if (const auto* l = std::get_if<double>(&x)) {
      const auto* r = std::get_if<double>(&y);
      return r && (*l == *r || (std::isnan(*l) && std::isnan(*r)));
    }
    return x == y;
  };
  return lhs.type == rhs.type
         && std::equal(lhs.primary_key.begin(), lhs.primary_key.end(),
                       rhs.primary_key.begin(), rhs.primary_key.end(), same);
}

auto hash(const entity_key& x) -> size_t {
  auto seed = std::hash<std::string>{}(x.type);
  for (const auto& component : x.primary_key) {
    boost::hash_combine(seed, component.index());
    std::visit(
      [&]<class T>(const T& value) {
        if constexpr (std::is_same_v<T, double>) {
          // Keys that compare equal must hash equally: all NaNs are one
          // value, and so are both zeros.
          auto canonical = std::isnan(value)
                             ? std::numeric_limits<double>::quiet_NaN()
                             : value == 0.0 ? 0.0 : value;
          boost::hash_combine(seed, std::hash<double>{}(canonical));
        } else if constexpr (not std::is_same_v<T, caf::none_t>) {
          boost::hash_combine(seed, std::hash<T>{}(value));
        }
      },
      component);
  }
  return seed;
}

} // namespace tally
