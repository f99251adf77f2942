#include "sindex/query/bytes.hpp"

namespace sindex::query {

auto is_valid_utf8(std::string_view s) noexcept -> bool {
  const auto* p = reinterpret_cast<const unsigned char*>(s.data());
  const std::size_t n = s.size();
  std::size_t i = 0;
  while (i < n) {
    const unsigned char c = p[i];
    if (c < 0x80) { ++i; continue; }

    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min_cp = 0;
    if ((c & 0xE0u) == 0xC0u) { extra = 1; cp = c & 0x1Fu; min_cp = 0x80; }
    else if ((c & 0xF0u) == 0xE0u) { extra = 2; cp = c & 0x0Fu; min_cp = 0x800; }
    else if ((c & 0xF8u) == 0xF0u) { extra = 3; cp = c & 0x07u; min_cp = 0x10000; }
    else return false;

    if (n - i <= extra) return false;
    for (std::size_t k = 1; k <= extra; ++k) {
      const unsigned char cc = p[i + k];
      if ((cc & 0xC0u) != 0x80u) return false;
      cp = (cp << 6) | (cc & 0x3Fu);
    }
    if (cp < min_cp) return false;                      // overlong
    if (cp >= 0xD800u && cp <= 0xDFFFu) return false;   // surrogate
    if (cp > 0x10FFFFu) return false;
    i += extra + 1;
  }
  return true;
}

} // namespace sindex::query
