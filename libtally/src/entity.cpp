//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/entity.hpp"

#include "tally/detail/assert.hpp"

namespace tally {

auto to_string(attribute_kind x) -> std::string_view {
  switch (x) {
    case attribute_kind::column:
      return "column";
    case attribute_kind::primary_key:
      return "primary_key";
    case attribute_kind::many_to_one:
      return "many_to_one";
    case attribute_kind::one_to_many:
      return "one_to_many";
    case attribute_kind::many_to_many:
      return "many_to_many";
  }
  TALLY_UNREACHABLE();
}

auto is_collection(attribute_kind x) -> bool {
  return x == attribute_kind::one_to_many || x == attribute_kind::many_to_many;
}

static_schema::static_schema(
  std::string name,
  std::vector<std::pair<std::string, attribute_kind>> attributes)
  : name_{std::move(name)} {
  attributes_.reserve(attributes.size());
  for (auto& [attribute, kind] : attributes)
    attributes_.insert_or_assign(attribute, kind);
}

auto static_schema::name() const -> std::string_view {
  return name_;
}

auto static_schema::classify(std::string_view attribute) const
  -> attribute_kind {
  auto i = attributes_.find(attribute);
  if (i == attributes_.end())
    return attribute_kind::column;
  return i->second;
}

} // namespace tally
