#pragma once

/** \file particle.hpp
 *  \brief Particle types: the remote store's wire tags for encoded values.
 *
 * The numeric values are part of the wire contract and must not change.
 */

#include <cstdint>
#include <expected>
#include <string_view>

#include "sindex/error.hpp"

namespace sindex::query {

enum class particle_type : std::uint8_t {
  null = 0,
  integer = 1,
  double_ = 2,
  string = 3,
  blob = 4,
  boolean = 17,
  hll = 18,
  map = 19,
  list = 20,
  geojson = 23,
};

constexpr std::uint8_t to_byte(particle_type t) noexcept {
  return static_cast<std::uint8_t>(t);
}

// Decode a wire tag; unknown tags yield error_code::data_integrity.
auto particle_type_from_byte(std::uint8_t b) -> std::expected<particle_type, core::error>;

auto to_string(particle_type t) noexcept -> std::string_view;

} // namespace sindex::query
