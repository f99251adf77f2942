#pragma once

/** \file filter.hpp
 *  \brief Secondary index query filter: construction and command-buffer serialization.
 *
 * Wire layout written by filter::write (big-endian, relative to offset):
 *   1 byte   name length N
 *   N bytes  bin name (UTF-8)
 *   1 byte   particle type of the begin value
 *   4 bytes  begin payload length B, then B payload bytes
 *   4 bytes  end payload length E, then E payload bytes
 *
 * Sizing contract: estimate_size() is exactly the number of bytes write() consumes,
 * so a command buffer may be allocated once from the sum of field estimates.
 * Thread-safety: filters are immutable after construction.
 * Errors: returned via std::expected with sindex::core::error.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sindex/error.hpp"
#include "sindex/query/collection_type.hpp"
#include "sindex/query/particle.hpp"
#include "sindex/query/value.hpp"

namespace sindex::query {

// name length(1) + particle type(1) + begin length(4) + end length(4)
constexpr std::size_t FILTER_FIXED_OVERHEAD = 1 + 1 + 4 + 4;
constexpr std::size_t MAX_BIN_NAME_BYTES = 255;

/**
 * \brief Immutable secondary index predicate on one bin.
 *
 * Only one filter particle type exists per filter; it is taken from begin_value().
 * Equality and contains filters carry the same value as begin_value() and end_value().
 */
class filter {
public:
  /** Integer equality on a scalar index. */
  static auto equal(std::string_view name, std::int64_t v) -> std::expected<filter, core::error>;
  /** String equality on a scalar index. */
  static auto equal(std::string_view name, std::string_view v) -> std::expected<filter, core::error>;
  /** Equality on an arbitrary value; kept for callers that already hold a value. */
  static auto equal(std::string_view name, const value& v) -> std::expected<filter, core::error>;

  /** Integer membership on a list/map collection index. */
  static auto contains(std::string_view name, index_collection_type type, std::int64_t v)
      -> std::expected<filter, core::error>;
  /** String membership on a list/map collection index. */
  static auto contains(std::string_view name, index_collection_type type, std::string_view v)
      -> std::expected<filter, core::error>;

  /** Inclusive integer range. There are no string ranges. */
  static auto range(std::string_view name, std::int64_t begin, std::int64_t end)
      -> std::expected<filter, core::error>;
  static auto range(std::string_view name, index_collection_type type, std::int64_t begin, std::int64_t end)
      -> std::expected<filter, core::error>;
  /** Range over pre-built values; rejected unless begin is an integer. */
  static auto range(std::string_view name, const value& begin, const value& end)
      -> std::expected<filter, core::error>;
  static auto range(std::string_view name, index_collection_type type, const value& begin, const value& end)
      -> std::expected<filter, core::error>;

  auto estimate_size() const noexcept -> std::size_t;

  /** Serialize at offset; returns the offset following the last byte written.
   *  Capacity is checked against estimate_size() first; on failure nothing is written. */
  auto write(std::span<std::uint8_t> buf, std::size_t offset) const
      -> std::expected<std::size_t, core::error>;

  auto name() const noexcept -> std::string_view { return name_; }
  auto collection_type() const noexcept -> index_collection_type { return type_; }
  auto begin_value() const noexcept -> const value& { return begin_; }
  auto end_value() const noexcept -> const value& { return end_; }
  auto particle_type() const noexcept -> query::particle_type { return begin_.particle_type(); }

  bool operator==(const filter&) const = default;

private:
  filter(std::string name, index_collection_type type, value begin, value end);

  static auto make(std::string_view name, index_collection_type type, value begin, value end)
      -> std::expected<filter, core::error>;

  std::string name_;
  index_collection_type type_{index_collection_type::DEFAULT};
  value begin_;
  value end_;
};

// Allocate exactly estimate_size() bytes and write the filter at offset 0.
auto encode_filter(const filter& f) -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace sindex::query
