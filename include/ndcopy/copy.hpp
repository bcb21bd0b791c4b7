#pragma once

#include <cstddef>
#include <cstring>
#include <type_traits>

#include "ndcopy/core/copy_def.hpp"
#include "ndcopy/core/geometry.hpp"
#include "ndcopy/core/rows.hpp"
#include "ndcopy/core/runtime_shape.hpp"
#include "ndcopy/core/shape.hpp"
#include "ndcopy/memops/host_copy.hpp"
#include "ndcopy/utils/macros.hpp"

namespace ndcopy {

/**
 * Copies `length` contiguous elements.
 */
template<typename T>
NDCOPY_INLINE void copy_row(const T* src, T* dst, size_t length) {
    std::memcpy(dst, src, length * sizeof(T));
}

/**
 * Throws `BoundsViolation` unless both the source and the destination region of a copy fit inside
 * their arrays.
 */
template<size_t N, typename Src, typename Dst>
void check_copy_bounds(
    const Size<N>& extent,
    const Src& src_shape,
    const Index<N>& src_min,
    const Dst& dst_shape,
    const Index<N>& dst_min) {
    check_region_bounds("source", src_shape, src_min, extent, N);
    check_region_bounds("destination", dst_shape, dst_min, extent, N);
}

/**
 * Copies the region of `extent` cells starting at `src_min` in `src` to the region starting at
 * `dst_min` in `dst`, one `memcpy` per innermost row.
 *
 * Unchecked: the caller must guarantee that `src_min + extent <= src_shape.sizes()` and
 * `dst_min + extent <= dst_shape.sizes()` along every axis, that the buffers hold at least
 * `total_size()` elements, and that the two regions do not overlap.
 */
template<size_t N, typename T, typename Src, typename Dst>
void copy_unchecked(
    const Size<N>& extent,
    const T* src,
    const Src& src_shape,
    const Index<N>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<N>& dst_min) {
    static_assert(std::is_trivially_copyable_v<T>, "elements must be trivially copyable");
    static_assert(is_shape_v<Src> && is_shape_v<Dst>, "expecting a shape type");
    static_assert(Src::rank == N, "rank of the source shape does not match the extent");
    static_assert(Dst::rank == N, "rank of the destination shape does not match the extent");

    const size_t row_length = extent[N - 1];

    for_each_row(extent, [&](const Index<N>& row) {
        auto src_offset = static_cast<size_t>(src_shape.linearize(src_min + row));
        auto dst_offset = static_cast<size_t>(dst_shape.linearize(dst_min + row));
        copy_row(src + src_offset, dst + dst_offset, row_length);
    });
}

/**
 * Same as `copy_unchecked`, but first checks that both regions fit inside their arrays. Throws
 * `BoundsViolation` otherwise, before anything is written.
 */
template<size_t N, typename T, typename Src, typename Dst>
void copy(
    const Size<N>& extent,
    const T* src,
    const Src& src_shape,
    const Index<N>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<N>& dst_min) {
    check_copy_bounds(extent, src_shape, src_min, dst_shape, dst_min);
    copy_unchecked(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

template<typename T, typename Src, typename Dst>
void copy1(
    const Size<1>& extent,
    const T* src,
    const Src& src_shape,
    const Index<1>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<1>& dst_min) {
    copy<1>(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

template<typename T, typename Src, typename Dst>
void copy2(
    const Size<2>& extent,
    const T* src,
    const Src& src_shape,
    const Index<2>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<2>& dst_min) {
    copy<2>(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

template<typename T, typename Src, typename Dst>
void copy3(
    const Size<3>& extent,
    const T* src,
    const Src& src_shape,
    const Index<3>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<3>& dst_min) {
    copy<3>(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

template<typename T, typename Src, typename Dst>
void copy4(
    const Size<4>& extent,
    const T* src,
    const Src& src_shape,
    const Index<4>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<4>& dst_min) {
    copy<4>(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

template<typename T, typename Src, typename Dst>
void copy1_unchecked(
    const Size<1>& extent,
    const T* src,
    const Src& src_shape,
    const Index<1>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<1>& dst_min) {
    copy_unchecked<1>(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

template<typename T, typename Src, typename Dst>
void copy2_unchecked(
    const Size<2>& extent,
    const T* src,
    const Src& src_shape,
    const Index<2>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<2>& dst_min) {
    copy_unchecked<2>(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

template<typename T, typename Src, typename Dst>
void copy3_unchecked(
    const Size<3>& extent,
    const T* src,
    const Src& src_shape,
    const Index<3>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<3>& dst_min) {
    copy_unchecked<3>(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

template<typename T, typename Src, typename Dst>
void copy4_unchecked(
    const Size<4>& extent,
    const T* src,
    const Src& src_shape,
    const Index<4>& src_min,
    T* dst,
    const Dst& dst_shape,
    const Index<4>& dst_min) {
    copy_unchecked<4>(extent, src, src_shape, src_min, dst, dst_shape, dst_min);
}

/**
 * Copy for a number of axes that is only known at run time. Static and dynamic shapes convert
 * implicitly to `RuntimeShape`.
 *
 * Throws `DimensionMismatch` if `extent`, the shapes and the minimum corners do not all have the
 * same number of axes, and `BoundsViolation` if either region does not fit inside its array. Both
 * are raised before anything is written.
 */
template<typename T>
void copy_n(
    const RuntimeIndex& extent,
    const T* src,
    const RuntimeShape& src_shape,
    const RuntimeIndex& src_min,
    T* dst,
    const RuntimeShape& dst_shape,
    const RuntimeIndex& dst_min) {
    static_assert(std::is_trivially_copyable_v<T>, "elements must be trivially copyable");

    auto copy_description =
        CopyDef::from_shapes(sizeof(T), extent, src_shape, src_min, dst_shape, dst_min);

    execute_copy(src, dst, copy_description);
}

}  // namespace ndcopy
