#include "sindex/query/decode.hpp"

#include <initializer_list>
#include <string>

#include "sindex/query/bytes.hpp"

namespace sindex::query {

namespace {

auto truncated(const char* what) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::precondition_failed,
                                     std::string("truncated filter: ") + what, "query.filter.decode"});
}

} // namespace

auto decode_filter(std::span<const std::uint8_t> bytes, std::size_t offset)
    -> std::expected<filter_view, core::error> {
  if (offset > bytes.size()) return truncated("offset past end");
  auto remaining = [&]() { return bytes.size() - offset; };

  if (remaining() < 1) return truncated("name length");
  const std::size_t name_len = bytes[offset++];
  if (remaining() < name_len) return truncated("name");
  filter_view v;
  v.name = std::string_view{reinterpret_cast<const char*>(bytes.data() + offset), name_len};
  offset += name_len;

  if (remaining() < 1) return truncated("particle type");
  auto type = particle_type_from_byte(bytes[offset++]);
  if (!type) return std::unexpected(type.error());
  v.type = *type;

  for (auto* payload : {&v.begin, &v.end}) {
    if (remaining() < 4) return truncated("payload length");
    const std::size_t len = load_be32(bytes.data() + offset);
    offset += 4;
    if (remaining() < len) return truncated("payload");
    *payload = bytes.subspan(offset, len);
    offset += len;
  }
  v.next_offset = offset;
  return v;
}

auto decode_value(particle_type type, std::span<const std::uint8_t> payload)
    -> std::expected<value, core::error> {
  using core::error; using core::error_code;
  switch (type) {
    case particle_type::integer:
      if (payload.size() != INTEGER_PAYLOAD_SIZE) {
        return std::unexpected(error{error_code::data_integrity,
                                     "integer payload must be 8 bytes, got " + std::to_string(payload.size()),
                                     "query.filter.decode"});
      }
      return value::from_integer(static_cast<std::int64_t>(load_be64(payload.data())));
    case particle_type::string:
      return value::from_string(std::string_view{reinterpret_cast<const char*>(payload.data()), payload.size()});
    case particle_type::blob:
      return value::from_blob(payload);
    default:
      break;
  }
  return std::unexpected(error{error_code::unsupported,
                               std::string("unsupported filter particle type ") + std::string(to_string(type)),
                               "query.filter.decode"});
}

} // namespace sindex::query
