#pragma once

/** \file value.hpp
 *  \brief Typed scalar used as a filter endpoint: particle type, size estimate, payload writer.
 *
 * Payload encoding:
 * - integer: 8 bytes, big-endian two's complement
 * - string: UTF-8 bytes, no terminator
 * - blob: raw bytes
 *
 * Invariant: estimate_size() equals the number of bytes write() emits.
 * Thread-safety: immutable after construction; safe to share.
 * Errors: returned via std::expected with sindex::core::error.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sindex/error.hpp"
#include "sindex/query/particle.hpp"

namespace sindex::query {

constexpr std::size_t INTEGER_PAYLOAD_SIZE = 8;

class value {
public:
  static auto from_integer(std::int64_t v) -> value { return value{payload_t{v}}; }
  static auto from_string(std::string_view s) -> value { return value{payload_t{std::string(s)}}; }
  static auto from_blob(std::span<const std::uint8_t> bytes) -> value {
    return value{payload_t{std::vector<std::uint8_t>(bytes.begin(), bytes.end())}};
  }

  auto particle_type() const noexcept -> query::particle_type;

  /** Payload byte length, excluding any length prefix or tag owned by the caller. */
  auto estimate_size() const noexcept -> std::size_t;

  /** Encode the payload at offset; returns bytes written. Nothing is written on failure. */
  auto write(std::span<std::uint8_t> buf, std::size_t offset) const
      -> std::expected<std::size_t, core::error>;

  auto as_integer() const noexcept -> std::optional<std::int64_t>;
  auto as_string() const noexcept -> std::optional<std::string_view>;
  auto as_blob() const noexcept -> std::optional<std::span<const std::uint8_t>>;

  bool operator==(const value&) const = default;

private:
  using payload_t = std::variant<std::int64_t, std::string, std::vector<std::uint8_t>>;

  explicit value(payload_t p) : payload_(std::move(p)) {}

  payload_t payload_;
};

} // namespace sindex::query
