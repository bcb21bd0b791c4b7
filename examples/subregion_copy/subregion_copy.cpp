#include <cstdint>
#include <vector>

#include "spdlog/spdlog.h"

#include "ndcopy/ndcopy.hpp"

using SourceShape = ndcopy::StaticShape<100, 100, 100>;
using DestinationShape = ndcopy::StaticShape<50, 50, 50>;

int main(void) {
    ndcopy::apply_config(ndcopy::default_config_from_environment());

    std::vector<uint8_t> src(SourceShape::total_size());
    std::vector<uint8_t> dst(DestinationShape::total_size(), 0);

    for (size_t i = 0; i < src.size(); i++) {
        src[i] = static_cast<uint8_t>(i % 251);
    }

    auto extent = ndcopy::Size(20, 20, 20);
    auto src_min = ndcopy::Index(1, 2, 3);
    auto dst_min = ndcopy::Index(2, 3, 4);

    SourceShape src_shape;
    DestinationShape dst_shape;

    ndcopy::copy3(extent, src.data(), src_shape, src_min, dst.data(), dst_shape, dst_min);
    spdlog::info("copied {} cells from {} to {}", extent.volume(), src_min, dst_min);

    // The same copy through the runtime-rank path, into a second buffer.
    std::vector<uint8_t> dst_runtime(DestinationShape::total_size(), 0);
    ndcopy::copy_n(
        ndcopy::to_runtime_index(extent),
        src.data(),
        src_shape,
        ndcopy::to_runtime_index(src_min),
        dst_runtime.data(),
        dst_shape,
        ndcopy::to_runtime_index(dst_min));

    if (dst != dst_runtime) {
        spdlog::error("fixed-rank and runtime-rank copies disagree");
        return 1;
    }

    // A region that sticks out of the destination is rejected before anything is written.
    try {
        ndcopy::copy3(
            extent,
            src.data(),
            src_shape,
            src_min,
            dst.data(),
            dst_shape,
            ndcopy::Index(40, 0, 0));
        spdlog::error("expected the copy to be rejected");
        return 1;
    } catch (const ndcopy::BoundsViolation& e) {
        spdlog::info("rejected: {}", e.what());
    }

    spdlog::info("done");
    return 0;
}
