#include "sindex/query/collection_type.hpp"
#include "sindex/query/particle.hpp"

#include <string>

namespace sindex::query {

auto particle_type_from_byte(std::uint8_t b) -> std::expected<particle_type, core::error> {
  using core::error; using core::error_code;
  switch (b) {
    case 0: return particle_type::null;
    case 1: return particle_type::integer;
    case 2: return particle_type::double_;
    case 3: return particle_type::string;
    case 4: return particle_type::blob;
    case 17: return particle_type::boolean;
    case 18: return particle_type::hll;
    case 19: return particle_type::map;
    case 20: return particle_type::list;
    case 23: return particle_type::geojson;
    default: break;
  }
  return std::unexpected(error{error_code::data_integrity,
                               "unknown particle type " + std::to_string(b), "query.particle"});
}

auto to_string(particle_type t) noexcept -> std::string_view {
  switch (t) {
    case particle_type::null: return "null";
    case particle_type::integer: return "integer";
    case particle_type::double_: return "double";
    case particle_type::string: return "string";
    case particle_type::blob: return "blob";
    case particle_type::boolean: return "boolean";
    case particle_type::hll: return "hll";
    case particle_type::map: return "map";
    case particle_type::list: return "list";
    case particle_type::geojson: return "geojson";
  }
  return "unknown";
}

auto collection_type_from_byte(std::uint8_t b) -> std::expected<index_collection_type, core::error> {
  using core::error; using core::error_code;
  switch (b) {
    case 0: return index_collection_type::DEFAULT;
    case 1: return index_collection_type::LIST;
    case 2: return index_collection_type::MAPKEYS;
    case 3: return index_collection_type::MAPVALUES;
    default: break;
  }
  return std::unexpected(error{error_code::data_integrity,
                               "unknown index collection type " + std::to_string(b),
                               "query.collection_type"});
}

auto to_string(index_collection_type t) noexcept -> std::string_view {
  switch (t) {
    case index_collection_type::DEFAULT: return "DEFAULT";
    case index_collection_type::LIST: return "LIST";
    case index_collection_type::MAPKEYS: return "MAPKEYS";
    case index_collection_type::MAPVALUES: return "MAPVALUES";
  }
  return "unknown";
}

} // namespace sindex::query
