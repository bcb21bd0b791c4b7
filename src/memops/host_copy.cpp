#include <cstdint>
#include <cstring>

#include "spdlog/spdlog.h"

#include "ndcopy/memops/host_copy.hpp"

namespace ndcopy {

void execute_copy(const void* src_buffer, void* dst_buffer, const CopyDef& copy_description) {
    size_t row_bytes = copy_description.row_bytes();

    spdlog::trace(
        "execute copy: rows={} row_bytes={} src_offset={} dst_offset={} counts={}",
        copy_description.number_of_rows(),
        row_bytes,
        copy_description.src_offset,
        copy_description.dst_offset,
        copy_description.counts);

    copy_description.for_each_row([&](size_t src_offset, size_t dst_offset) {
        std::memcpy(
            static_cast<uint8_t*>(dst_buffer) + dst_offset,
            static_cast<const uint8_t*>(src_buffer) + src_offset,
            row_bytes);
    });
}

}  // namespace ndcopy
