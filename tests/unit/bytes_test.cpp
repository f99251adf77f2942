#include <catch2/catch_all.hpp>
#include <sindex/query/bytes.hpp>

#include <array>
#include <string>

using namespace sindex::query;

TEST_CASE("big-endian stores put the most significant byte first", "[bytes]") {
  std::array<std::uint8_t, 8> b{};
  store_be32(b.data(), 0x01020304u);
  REQUIRE(b[0] == 0x01);
  REQUIRE(b[1] == 0x02);
  REQUIRE(b[2] == 0x03);
  REQUIRE(b[3] == 0x04);
  REQUIRE(load_be32(b.data()) == 0x01020304u);

  store_be64(b.data(), 0x0102030405060708ull);
  REQUIRE(b == std::array<std::uint8_t, 8>{1, 2, 3, 4, 5, 6, 7, 8});
  REQUIRE(load_be64(b.data()) == 0x0102030405060708ull);
}

TEST_CASE("negative integers keep two's complement layout", "[bytes]") {
  std::array<std::uint8_t, 8> b{};
  store_be64(b.data(), static_cast<std::uint64_t>(std::int64_t{-2}));
  REQUIRE(b == std::array<std::uint8_t, 8>{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE});
  REQUIRE(static_cast<std::int64_t>(load_be64(b.data())) == -2);
}

TEST_CASE("utf8 validation", "[bytes][utf8]") {
  REQUIRE(is_valid_utf8(""));
  REQUIRE(is_valid_utf8("bin1"));
  REQUIRE(is_valid_utf8("\xC3\xA9t\xC3\xA9"));            // été
  REQUIRE(is_valid_utf8("\xE2\x82\xAC"));                  // euro sign
  REQUIRE(is_valid_utf8("\xF0\x9F\x98\x80"));              // emoji
  REQUIRE_FALSE(is_valid_utf8("\xC3"));                    // truncated
  REQUIRE_FALSE(is_valid_utf8("\xC0\xAF"));                // overlong '/'
  REQUIRE_FALSE(is_valid_utf8("\xED\xA0\x80"));            // surrogate
  REQUIRE_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));        // > U+10FFFF
  REQUIRE_FALSE(is_valid_utf8("\x80"));                    // stray continuation
  REQUIRE_FALSE(is_valid_utf8(std::string("ab\xFF", 3)));
}
