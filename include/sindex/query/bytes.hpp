#pragma once

/** \file bytes.hpp
 *  \brief Big-endian integer packing and UTF-8 checks for the command wire format.
 *
 * Endianness: big-endian (network order) on all platforms.
 * Callers are responsible for bounds; these helpers never check capacity.
 */

#include <cstdint>
#include <string_view>

namespace sindex::query {

inline void store_be32(std::uint8_t* p, std::uint32_t v) noexcept {
  p[0] = static_cast<std::uint8_t>(v >> 24);
  p[1] = static_cast<std::uint8_t>(v >> 16);
  p[2] = static_cast<std::uint8_t>(v >> 8);
  p[3] = static_cast<std::uint8_t>(v);
}

inline void store_be64(std::uint8_t* p, std::uint64_t v) noexcept {
  for (int i = 7; i >= 0; --i) {
    p[i] = static_cast<std::uint8_t>(v);
    v >>= 8;
  }
}

inline auto load_be32(const std::uint8_t* p) noexcept -> std::uint32_t {
  return (std::uint32_t{p[0]} << 24) | (std::uint32_t{p[1]} << 16) |
         (std::uint32_t{p[2]} << 8) | std::uint32_t{p[3]};
}

inline auto load_be64(const std::uint8_t* p) noexcept -> std::uint64_t {
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
  return v;
}

// Strict UTF-8 validation: rejects overlong forms, surrogates and code points > U+10FFFF.
auto is_valid_utf8(std::string_view s) noexcept -> bool;

} // namespace sindex::query
