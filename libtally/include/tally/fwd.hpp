//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/config.hpp" // IWYU pragma: export

#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#define TALLY_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(tally_types, type)

namespace tally {

// -- classes ------------------------------------------------------------------

class entity;
class entity_schema;
class operation_ledger;
class static_schema;
class unit_of_work;
class version_writer;

// -- structs ------------------------------------------------------------------

struct entity_key;
struct operation;

// -- enum classes -------------------------------------------------------------

enum class attribute_kind : uint8_t;
enum class ec : uint8_t;
enum class lifecycle_event : uint8_t;
enum class operation_kind : int8_t;

// -- aliases ------------------------------------------------------------------

using entity_ptr = std::shared_ptr<entity>;

namespace detail {

struct stable_map_policy;

template <class, class, class, class>
class vector_map;

/// A map abstraction over an unsorted `std::vector`.
template <class Key, class T,
          class Allocator = std::allocator<std::pair<Key, T>>>
using stable_map = vector_map<Key, T, Allocator, stable_map_policy>;

} // namespace detail

} // namespace tally

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_tally_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(tally_types, first_tally_type_id)

  TALLY_ADD_TYPE_ID((tally::ec))

CAF_END_TYPE_ID_BLOCK(tally_types)

#undef TALLY_ADD_TYPE_ID
