#include <catch2/catch_all.hpp>
#include <sindex/query/decode.hpp>
#include <sindex/query/filter.hpp>

#include <string>
#include <vector>

using namespace sindex::query;
using sindex::core::error_code;

static std::vector<std::uint8_t> payload_bytes(const value& v) {
  std::vector<std::uint8_t> out(v.estimate_size());
  REQUIRE(v.write(out, 0).has_value());
  return out;
}

TEST_CASE("decode recovers every written field", "[filter][decode]") {
  auto f = filter::range("age", 18, 65);
  REQUIRE(f.has_value());
  auto bytes = encode_filter(*f);
  REQUIRE(bytes.has_value());

  auto d = decode_filter(*bytes);
  REQUIRE(d.has_value());
  REQUIRE(d->name == "age");
  REQUIRE(d->type == particle_type::integer);
  REQUIRE(std::vector<std::uint8_t>(d->begin.begin(), d->begin.end()) == payload_bytes(f->begin_value()));
  REQUIRE(std::vector<std::uint8_t>(d->end.begin(), d->end.end()) == payload_bytes(f->end_value()));
  REQUIRE(d->next_offset == bytes->size());

  auto b = decode_value(d->type, d->begin);
  auto e = decode_value(d->type, d->end);
  REQUIRE(b.has_value());
  REQUIRE(e.has_value());
  REQUIRE(*b == f->begin_value());
  REQUIRE(*e == f->end_value());
}

TEST_CASE("decode walks consecutive filters in one buffer", "[filter][decode]") {
  auto a = filter::contains("tags", index_collection_type::LIST, "red");
  auto b = filter::equal("n", -1);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  std::vector<std::uint8_t> buf(a->estimate_size() + b->estimate_size());
  auto off = a->write(buf, 0);
  REQUIRE(off.has_value());
  REQUIRE(b->write(buf, *off).has_value());

  auto da = decode_filter(buf);
  REQUIRE(da.has_value());
  REQUIRE(da->name == "tags");
  REQUIRE(da->type == particle_type::string);
  REQUIRE(decode_value(da->type, da->begin)->as_string() == "red");

  auto db = decode_filter(buf, da->next_offset);
  REQUIRE(db.has_value());
  REQUIRE(db->name == "n");
  REQUIRE(decode_value(db->type, db->end)->as_integer() == -1);
  REQUIRE(db->next_offset == buf.size());
}

TEST_CASE("decode rejects every truncation", "[filter][decode][errors]") {
  auto f = filter::equal("bin1", "value");
  REQUIRE(f.has_value());
  auto bytes = encode_filter(*f);
  REQUIRE(bytes.has_value());
  for (std::size_t n = 0; n < bytes->size(); ++n) {
    std::span<const std::uint8_t> cut{bytes->data(), n};
    auto d = decode_filter(cut);
    REQUIRE_FALSE(d.has_value());
    REQUIRE(d.error().code == error_code::precondition_failed);
  }
  auto past = decode_filter(*bytes, bytes->size() + 1);
  REQUIRE_FALSE(past.has_value());
  REQUIRE(past.error().code == error_code::precondition_failed);
}

TEST_CASE("decode rejects unknown particle tags", "[filter][decode][errors]") {
  std::vector<std::uint8_t> bytes{0x01, 'x', 0x63, 0, 0, 0, 0, 0, 0, 0, 0};
  auto d = decode_filter(bytes);
  REQUIRE_FALSE(d.has_value());
  REQUIRE(d.error().code == error_code::data_integrity);
}

TEST_CASE("decode_value validates payloads", "[value][decode][errors]") {
  const std::vector<std::uint8_t> seven(7, 0);
  auto bad_int = decode_value(particle_type::integer, seven);
  REQUIRE_FALSE(bad_int.has_value());
  REQUIRE(bad_int.error().code == error_code::data_integrity);

  auto geo = decode_value(particle_type::geojson, seven);
  REQUIRE_FALSE(geo.has_value());
  REQUIRE(geo.error().code == error_code::unsupported);

  auto blob = decode_value(particle_type::blob, seven);
  REQUIRE(blob.has_value());
  REQUIRE(blob->as_blob()->size() == 7);

  auto empty = decode_value(particle_type::string, {});
  REQUIRE(empty.has_value());
  REQUIRE(empty->as_string() == "");
}
