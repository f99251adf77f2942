#pragma once

/** \file collection_type.hpp
 *  \brief Secondary index collection types.
 *
 * DEFAULT indexes the bin's scalar value; the others index elements of a list bin,
 * keys of a map bin or values of a map bin. Codes match the remote store.
 */

#include <cstdint>
#include <expected>
#include <string_view>

#include "sindex/error.hpp"

namespace sindex::query {

enum class index_collection_type : std::uint8_t {
  DEFAULT = 0,
  LIST = 1,
  MAPKEYS = 2,
  MAPVALUES = 3,
};

constexpr std::uint8_t to_byte(index_collection_type t) noexcept {
  return static_cast<std::uint8_t>(t);
}

auto collection_type_from_byte(std::uint8_t b) -> std::expected<index_collection_type, core::error>;

auto to_string(index_collection_type t) noexcept -> std::string_view;

} // namespace sindex::query
