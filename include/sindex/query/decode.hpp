#pragma once

/** \file decode.hpp
 *  \brief Parse a serialized filter back into its fields (pure, in-memory, no payload copies).
 *
 * Used for diagnostics and verification of the bytes produced by filter::write.
 * The index collection type travels in a separate command field and is not recovered here.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

#include "sindex/error.hpp"
#include "sindex/query/particle.hpp"
#include "sindex/query/value.hpp"

namespace sindex::query {

struct filter_view {
  std::string_view name;                 // does not own memory
  particle_type type{particle_type::null};
  std::span<const std::uint8_t> begin;   // does not own memory
  std::span<const std::uint8_t> end;     // does not own memory
  std::size_t next_offset{};             // first byte after the filter
};

// Truncated input -> precondition_failed; unknown particle tag -> data_integrity.
auto decode_filter(std::span<const std::uint8_t> bytes, std::size_t offset = 0)
    -> std::expected<filter_view, core::error>;

// Rebuild a value from a payload. Integers must be exactly 8 bytes.
// Particle types other than integer, string and blob -> unsupported.
auto decode_value(particle_type type, std::span<const std::uint8_t> payload)
    -> std::expected<value, core::error>;

} // namespace sindex::query
