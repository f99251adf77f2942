#include "sindex/query/filter.hpp"

#include <cstring>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <utility>

#include "sindex/core/platform_utils.hpp"
#include "sindex/query/bytes.hpp"

namespace sindex::query {

namespace {

auto filter_debug() -> bool {
  static const bool dbg = core::env_flag_enabled("SINDEX_FILTER_DEBUG");
  return dbg;
}

auto reject(core::error_code code, std::string message) -> std::unexpected<core::error> {
  if (filter_debug()) {
    std::cerr << "[FILTER][build] rejected: " << message << std::endl;
  }
  return std::unexpected(core::error{code, std::move(message), "query.filter"});
}

} // namespace

filter::filter(std::string name, index_collection_type type, value begin, value end)
    : name_(std::move(name)), type_(type), begin_(std::move(begin)), end_(std::move(end)) {}

auto filter::make(std::string_view name, index_collection_type type, value begin, value end)
    -> std::expected<filter, core::error> {
  using core::error_code;
  if (name.size() > MAX_BIN_NAME_BYTES) {
    return reject(error_code::invalid_argument,
                  "bin name exceeds " + std::to_string(MAX_BIN_NAME_BYTES) + " bytes");
  }
  if (!is_valid_utf8(name)) {
    return reject(error_code::invalid_argument, "bin name is not valid UTF-8");
  }
  constexpr std::size_t max_payload = std::numeric_limits<std::uint32_t>::max();
  if (begin.estimate_size() > max_payload || end.estimate_size() > max_payload) {
    return reject(error_code::invalid_argument, "filter value too large");
  }
  return filter{std::string(name), type, std::move(begin), std::move(end)};
}

auto filter::equal(std::string_view name, std::int64_t v) -> std::expected<filter, core::error> {
  auto val = value::from_integer(v);
  return make(name, index_collection_type::DEFAULT, val, val);
}

auto filter::equal(std::string_view name, std::string_view v) -> std::expected<filter, core::error> {
  auto val = value::from_string(v);
  return make(name, index_collection_type::DEFAULT, val, val);
}

auto filter::equal(std::string_view name, const value& v) -> std::expected<filter, core::error> {
  return make(name, index_collection_type::DEFAULT, v, v);
}

auto filter::contains(std::string_view name, index_collection_type type, std::int64_t v)
    -> std::expected<filter, core::error> {
  auto val = value::from_integer(v);
  return make(name, type, val, val);
}

auto filter::contains(std::string_view name, index_collection_type type, std::string_view v)
    -> std::expected<filter, core::error> {
  auto val = value::from_string(v);
  return make(name, type, val, val);
}

auto filter::range(std::string_view name, std::int64_t begin, std::int64_t end)
    -> std::expected<filter, core::error> {
  return make(name, index_collection_type::DEFAULT, value::from_integer(begin), value::from_integer(end));
}

auto filter::range(std::string_view name, index_collection_type type, std::int64_t begin, std::int64_t end)
    -> std::expected<filter, core::error> {
  return make(name, type, value::from_integer(begin), value::from_integer(end));
}

auto filter::range(std::string_view name, const value& begin, const value& end)
    -> std::expected<filter, core::error> {
  return range(name, index_collection_type::DEFAULT, begin, end);
}

// The end value's type is deliberately not checked: the particle type written is begin's.
auto filter::range(std::string_view name, index_collection_type type, const value& begin, const value& end)
    -> std::expected<filter, core::error> {
  if (begin.particle_type() != query::particle_type::integer) {
    return reject(core::error_code::invalid_argument,
                  std::string("range filter requires integer values, got ") +
                      std::string(to_string(begin.particle_type())));
  }
  return make(name, type, begin, end);
}

auto filter::estimate_size() const noexcept -> std::size_t {
  return name_.size() + begin_.estimate_size() + end_.estimate_size() + FILTER_FIXED_OVERHEAD;
}

auto filter::write(std::span<std::uint8_t> buf, std::size_t offset) const
    -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  const std::size_t need = estimate_size();
  if (offset > buf.size() || buf.size() - offset < need) {
    if (filter_debug()) {
      std::cerr << "[FILTER][write] capacity violation: need=" << need << " offset=" << offset
                << " buffer=" << buf.size() << std::endl;
    }
    return std::unexpected(error{error_code::out_of_range, "buffer too small for filter", "query.filter"});
  }

  std::uint8_t* p = buf.data() + offset;
  *p++ = static_cast<std::uint8_t>(name_.size());
  if (!name_.empty()) { std::memcpy(p, name_.data(), name_.size()); p += name_.size(); }
  *p++ = to_byte(begin_.particle_type());
  offset = static_cast<std::size_t>(p - buf.data());

  for (const value* v : {&begin_, &end_}) {
    auto len = v->write(buf, offset + 4);
    if (!len) return std::unexpected(len.error());
    store_be32(buf.data() + offset, static_cast<std::uint32_t>(*len));
    offset += *len + 4;
  }
  return offset;
}

auto encode_filter(const filter& f) -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::vector<std::uint8_t> out(f.estimate_size());
  auto next = f.write(out, 0);
  if (!next) return std::unexpected(next.error());
  if (*next != out.size()) {
    return std::unexpected(core::error{core::error_code::internal, "filter size estimate mismatch", "query.filter"});
  }
  return out;
}

} // namespace sindex::query
