/**
 * @file multipart_plan.cpp
 * @brief Implementation of byte-range planning
 */

#include "kcenon/file_ripper/core/multipart_plan.h"

namespace kcenon::file_ripper {

auto split_ranges(uint64_t size, std::size_t parts) -> std::vector<byte_range> {
    std::vector<byte_range> ranges;
    if (parts == 0) {
        return ranges;
    }

    ranges.reserve(parts);
    const uint64_t base = size / parts;

    for (std::size_t i = 0; i < parts; ++i) {
        byte_range range;
        range.offset = base * i;
        range.length = (i == parts - 1) ? size - range.offset : base;
        ranges.push_back(range);
    }

    return ranges;
}

}  // namespace kcenon::file_ripper
