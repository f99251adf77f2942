/**
 * Query filter serialization example using sindex
 *
 * This example demonstrates:
 * - Building equality, range and contains filters
 * - Sizing one command buffer from the filter estimates
 * - Writing the filters back to back and decoding them again
 */

#include <sindex/query/decode.hpp>
#include <sindex/query/filter.hpp>

#include <cstdio>
#include <iostream>
#include <utility>
#include <vector>

static void hex_dump(const std::vector<std::uint8_t>& buf, std::size_t from, std::size_t to) {
    for (std::size_t i = from; i < to; ++i) {
        std::printf("%02x%s", buf[i], ((i - from) % 16 == 15 || i + 1 == to) ? "\n" : " ");
    }
}

int main() {
    using namespace sindex::query;

    std::vector<filter> filters;
    for (auto f : {filter::equal("bin1", 42),
                   filter::range("age", 18, 65),
                   filter::contains("tags", index_collection_type::LIST, "red")}) {
        if (!f) {
            std::cerr << "Failed to build filter: " << f.error().message << std::endl;
            return 1;
        }
        filters.push_back(std::move(*f));
    }

    std::size_t total = 0;
    for (const auto& f : filters) total += f.estimate_size();
    std::vector<std::uint8_t> buf(total);

    std::size_t offset = 0;
    for (const auto& f : filters) {
        auto next = f.write(buf, offset);
        if (!next) {
            std::cerr << "Failed to write filter: " << next.error().message << std::endl;
            return 1;
        }
        std::cout << "filter name=" << f.name()
                  << " collection=" << to_string(f.collection_type())
                  << " particle=" << to_string(f.particle_type())
                  << " bytes=" << (*next - offset) << std::endl;
        hex_dump(buf, offset, *next);
        offset = *next;
    }

    offset = 0;
    while (offset < buf.size()) {
        auto view = decode_filter(buf, offset);
        if (!view) {
            std::cerr << "Failed to decode filter: " << view.error().message << std::endl;
            return 1;
        }
        std::cout << "decoded name=" << view->name
                  << " begin_len=" << view->begin.size()
                  << " end_len=" << view->end.size() << std::endl;
        offset = view->next_offset;
    }
    return 0;
}
