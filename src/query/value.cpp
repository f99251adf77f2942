#include "sindex/query/value.hpp"

#include <cstring>

#include "sindex/query/bytes.hpp"

namespace sindex::query {

auto value::particle_type() const noexcept -> query::particle_type {
  if (std::holds_alternative<std::int64_t>(payload_)) return query::particle_type::integer;
  if (std::holds_alternative<std::string>(payload_)) return query::particle_type::string;
  return query::particle_type::blob;
}

auto value::estimate_size() const noexcept -> std::size_t {
  if (std::holds_alternative<std::int64_t>(payload_)) return INTEGER_PAYLOAD_SIZE;
  if (const auto* s = std::get_if<std::string>(&payload_)) return s->size();
  return std::get<std::vector<std::uint8_t>>(payload_).size();
}

auto value::write(std::span<std::uint8_t> buf, std::size_t offset) const
    -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  const std::size_t n = estimate_size();
  if (offset > buf.size() || buf.size() - offset < n) {
    return std::unexpected(error{error_code::out_of_range, "buffer too small for value", "query.value"});
  }
  std::uint8_t* p = buf.data() + offset;
  if (const auto* i = std::get_if<std::int64_t>(&payload_)) {
    store_be64(p, static_cast<std::uint64_t>(*i));
  } else if (const auto* s = std::get_if<std::string>(&payload_)) {
    if (n != 0) std::memcpy(p, s->data(), n);
  } else {
    const auto& b = std::get<std::vector<std::uint8_t>>(payload_);
    if (n != 0) std::memcpy(p, b.data(), n);
  }
  return n;
}

auto value::as_integer() const noexcept -> std::optional<std::int64_t> {
  if (const auto* i = std::get_if<std::int64_t>(&payload_)) return *i;
  return std::nullopt;
}

auto value::as_string() const noexcept -> std::optional<std::string_view> {
  if (const auto* s = std::get_if<std::string>(&payload_)) return std::string_view{*s};
  return std::nullopt;
}

auto value::as_blob() const noexcept -> std::optional<std::span<const std::uint8_t>> {
  if (const auto* b = std::get_if<std::vector<std::uint8_t>>(&payload_)) {
    return std::span<const std::uint8_t>{b->data(), b->size()};
  }
  return std::nullopt;
}

} // namespace sindex::query
