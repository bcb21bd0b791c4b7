#pragma once

#include <algorithm>
#include <cstddef>
#include <type_traits>

#include "ndcopy/core/fill_def.hpp"
#include "ndcopy/core/geometry.hpp"
#include "ndcopy/core/rows.hpp"
#include "ndcopy/core/runtime_shape.hpp"
#include "ndcopy/core/shape.hpp"
#include "ndcopy/memops/host_fill.hpp"

namespace ndcopy {

namespace detail {

// Keeps the fill value out of template argument deduction, so `fill2(..., 1, bytes, ...)` works.
template<typename T>
struct identity {
    using type = T;
};

}  // namespace detail

/**
 * Writes `value` into every cell of the region of `extent` cells starting at `dst_min` in `dst`,
 * one `std::fill_n` per innermost row.
 *
 * Unchecked: the caller must guarantee that `dst_min + extent <= dst_shape.sizes()` along every
 * axis and that `dst` holds at least `dst_shape.total_size()` elements.
 */
template<size_t N, typename T, typename Dst>
void fill_unchecked(
    const Size<N>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<N>& dst_min) {
    static_assert(is_shape_v<Dst>, "expecting a shape type");
    static_assert(Dst::rank == N, "rank of the destination shape does not match the extent");

    const size_t row_length = extent[N - 1];

    for_each_row(extent, [&](const Index<N>& row) {
        auto dst_offset = static_cast<size_t>(dst_shape.linearize(dst_min + row));
        std::fill_n(dst + dst_offset, row_length, value);
    });
}

/**
 * Same as `fill_unchecked`, but throws `BoundsViolation` if the region does not fit inside the
 * array, before anything is written.
 */
template<size_t N, typename T, typename Dst>
void fill(
    const Size<N>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<N>& dst_min) {
    check_region_bounds("destination", dst_shape, dst_min, extent, N);
    fill_unchecked(extent, value, dst, dst_shape, dst_min);
}

template<typename T, typename Dst>
void fill1(
    const Size<1>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<1>& dst_min) {
    fill<1>(extent, value, dst, dst_shape, dst_min);
}

template<typename T, typename Dst>
void fill2(
    const Size<2>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<2>& dst_min) {
    fill<2>(extent, value, dst, dst_shape, dst_min);
}

template<typename T, typename Dst>
void fill3(
    const Size<3>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<3>& dst_min) {
    fill<3>(extent, value, dst, dst_shape, dst_min);
}

template<typename T, typename Dst>
void fill4(
    const Size<4>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<4>& dst_min) {
    fill<4>(extent, value, dst, dst_shape, dst_min);
}

template<typename T, typename Dst>
void fill1_unchecked(
    const Size<1>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<1>& dst_min) {
    fill_unchecked<1>(extent, value, dst, dst_shape, dst_min);
}

template<typename T, typename Dst>
void fill2_unchecked(
    const Size<2>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<2>& dst_min) {
    fill_unchecked<2>(extent, value, dst, dst_shape, dst_min);
}

template<typename T, typename Dst>
void fill3_unchecked(
    const Size<3>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<3>& dst_min) {
    fill_unchecked<3>(extent, value, dst, dst_shape, dst_min);
}

template<typename T, typename Dst>
void fill4_unchecked(
    const Size<4>& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const Dst& dst_shape,
    const Index<4>& dst_min) {
    fill_unchecked<4>(extent, value, dst, dst_shape, dst_min);
}

/**
 * Fill for a number of axes that is only known at run time. Throws `DimensionMismatch` or
 * `BoundsViolation` before anything is written.
 */
template<typename T>
void fill_n(
    const RuntimeIndex& extent,
    const typename detail::identity<T>::type& value,
    T* dst,
    const RuntimeShape& dst_shape,
    const RuntimeIndex& dst_min) {
    static_assert(std::is_trivially_copyable_v<T>, "elements must be trivially copyable");

    auto fill_description = FillDef::from_shape(sizeof(T), &value, extent, dst_shape, dst_min);
    execute_fill(dst, fill_description);
}

}  // namespace ndcopy
