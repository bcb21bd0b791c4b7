#include <algorithm>
#include <cstdint>
#include <cstring>

#include "spdlog/spdlog.h"

#include "ndcopy/memops/host_fill.hpp"

namespace ndcopy {

void execute_fill(void* dst_buffer, size_t nbytes, const void* pattern, size_t pattern_nbytes) {
    if (nbytes == 0 || pattern_nbytes == 0) {
        return;
    }

    auto* dst = static_cast<uint8_t*>(dst_buffer);
    std::memcpy(dst, pattern, pattern_nbytes);

    // Keep doubling the prefix that already holds the pattern.
    size_t filled = pattern_nbytes;

    while (filled < nbytes) {
        size_t n = std::min(filled, nbytes - filled);
        std::memcpy(dst + filled, dst, n);
        filled += n;
    }
}

void execute_fill(void* dst_buffer, const FillDef& fill_description) {
    size_t pattern_nbytes = fill_description.element_size();
    size_t row_bytes = fill_description.elements_per_row() * pattern_nbytes;

    spdlog::trace(
        "execute fill: rows={} row_bytes={} dst_offset={} counts={}",
        fill_description.number_of_rows(),
        row_bytes,
        fill_description.dst_offset,
        fill_description.counts);

    fill_description.for_each_row([&](size_t dst_offset) {
        execute_fill(
            static_cast<uint8_t*>(dst_buffer) + dst_offset,
            row_bytes,
            fill_description.fill_value.data(),
            pattern_nbytes);
    });
}

}  // namespace ndcopy
