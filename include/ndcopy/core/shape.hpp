#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "fmt/format.h"

#include "errors.hpp"
#include "geometry.hpp"

#include "ndcopy/utils/checked_math.hpp"

namespace ndcopy {

/**
 * All shapes linearize in row-major order: the last axis varies fastest and has stride 1, the
 * stride of every other axis is the product of the sizes of all axes after it.
 */

namespace detail {

template<typename I, I... Dims>
constexpr fixed_array<I, sizeof...(Dims)> row_major_strides() {
    constexpr size_t rank = sizeof...(Dims);
    I sizes[rank] = {Dims...};
    fixed_array<I, rank> strides;
    I stride = static_cast<I>(1);

    for (size_t i = rank; i > 0; i--) {
        strides[i - 1] = stride;
        stride *= sizes[i - 1];
    }

    return strides;
}

template<typename I, I... Dims>
constexpr bool product_fits() {
    I sizes[] = {Dims...};
    I result = static_cast<I>(1);

    for (I size : sizes) {
        if (__builtin_mul_overflow(result, size, &result)) {
            return false;
        }
    }

    return true;
}

}  // namespace detail

/**
 * Shape whose sizes are part of the type. Every member is `constexpr`, so strides and offsets
 * fold into constants at the call site.
 */
template<typename I, I... Dims>
struct basic_static_shape {
    static_assert(sizeof...(Dims) > 0, "a shape must have at least one axis");
    static_assert(((Dims > static_cast<I>(0)) && ...), "every axis must have a positive size");
    static_assert(detail::product_fits<I, Dims...>(), "total size of shape overflows index type");

    static constexpr size_t rank = sizeof...(Dims);
    using index_type = I;

    static constexpr index_type size(size_t axis) noexcept {
        constexpr index_type sizes[rank] = {Dims...};
        return sizes[axis];
    }

    static constexpr index_type stride(size_t axis) noexcept {
        return strides_table[axis];
    }

    static constexpr index_type total_size() noexcept {
        return (Dims * ... * static_cast<index_type>(1));
    }

    static constexpr Size<rank, index_type> sizes() noexcept {
        return Size<rank, index_type> {fixed_array<index_type, rank> {Dims...}};
    }

    template<typename U>
    static constexpr index_type linearize(const fixed_array<U, rank>& index) noexcept {
        index_type offset = static_cast<index_type>(0);

        for (size_t i = 0; i < rank; i++) {
            offset += strides_table[i] * static_cast<index_type>(index[i]);
        }

        return offset;
    }

    /**
     * Inverse of `linearize` for offsets in `[0, total_size())`.
     */
    static constexpr Index<rank, index_type> delinearize(index_type offset) noexcept {
        Index<rank, index_type> result;

        for (size_t i = 0; i < rank; i++) {
            result[i] = offset / strides_table[i];
            offset %= strides_table[i];
        }

        return result;
    }

  private:
    static constexpr fixed_array<I, rank> strides_table = detail::row_major_strides<I, Dims...>();
};

template<size_t... Dims>
using StaticShape = basic_static_shape<size_t, Dims...>;

template<uint32_t... Dims>
using StaticShapeU32 = basic_static_shape<uint32_t, Dims...>;

/**
 * Shape whose sizes are given at construction. The stride table is computed once in the
 * constructor and reused by every call.
 */
template<size_t N, typename I = default_index_type>
class DynamicShape {
  public:
    static constexpr size_t rank = N;
    using index_type = I;

    DynamicShape(const Size<N, I>& sizes) : m_sizes(sizes) {
        index_type stride = static_cast<index_type>(1);

        for (size_t i = N; i > 0; i--) {
            if (compare_less(sizes[i - 1], 0)) {
                throw std::invalid_argument(
                    fmt::format("invalid shape {}: size of axis {} is negative", sizes, i - 1));
            }

            m_strides[i - 1] = stride;
            stride = checked_mul(stride, sizes[i - 1]);
        }

        m_total_size = stride;
    }

    template<typename... Ts, typename = typename std::enable_if<(sizeof...(Ts) + 1 == N)>::type>
    DynamicShape(index_type first, Ts... rest) :
        DynamicShape(Size<N, I>(first, static_cast<index_type>(rest)...)) {}

    index_type size(size_t axis) const noexcept {
        return m_sizes[axis];
    }

    index_type stride(size_t axis) const noexcept {
        return m_strides[axis];
    }

    index_type total_size() const noexcept {
        return m_total_size;
    }

    const Size<N, I>& sizes() const noexcept {
        return m_sizes;
    }

    template<typename U>
    index_type linearize(const fixed_array<U, N>& index) const noexcept {
        index_type offset = static_cast<index_type>(0);

        for (size_t i = 0; i < N; i++) {
            offset += m_strides[i] * static_cast<index_type>(index[i]);
        }

        return offset;
    }

    Index<N, I> delinearize(index_type offset) const noexcept {
        Index<N, I> result;

        for (size_t i = 0; i < N; i++) {
            result[i] = offset / m_strides[i];
            offset %= m_strides[i];
        }

        return result;
    }

  private:
    Size<N, I> m_sizes;
    fixed_array<I, N> m_strides;
    index_type m_total_size;
};

template<size_t N, typename I>
DynamicShape(Size<N, I>) -> DynamicShape<N, I>;

template<typename... Ts>
DynamicShape(Ts...) -> DynamicShape<sizeof...(Ts)>;

/**
 * Compile-time check that `S` offers the shape interface: `rank`, `index_type`, `size`, `stride`,
 * `total_size` and `linearize`.
 */
template<typename S, typename = void>
struct is_shape: std::false_type {};

template<typename S>
struct is_shape<
    S,
    std::void_t<
        decltype(S::rank),
        typename S::index_type,
        decltype(std::declval<const S&>().size(size_t {})),
        decltype(std::declval<const S&>().stride(size_t {})),
        decltype(std::declval<const S&>().total_size()),
        decltype(std::declval<const S&>().linearize(
            std::declval<const fixed_array<typename S::index_type, S::rank>&>()
        ))>>: std::true_type {};

template<typename S>
inline constexpr bool is_shape_v = is_shape<S>::value;

/**
 * Returns `true` if the cells `[offset, offset + extent)` lie inside `[0, size)`. An empty range
 * (`extent <= 0`) always fits.
 */
template<typename S, typename O, typename E>
constexpr bool axis_in_bounds(S size, O offset, E extent) {
    if (!compare_greater(extent, 0)) {
        return true;
    }

    if (compare_less(offset, 0) || compare_greater(extent, size)) {
        return false;
    }

    // `0 < extent <= size`, so the subtraction cannot wrap.
    return !compare_greater(offset, size - static_cast<S>(extent));
}

/**
 * Throws `BoundsViolation` if the region starting at `min` with the given `extent` does not fit
 * inside `shape`. An empty region fits anywhere. Works for every shape kind and for any indexable
 * `min` and `extent` holding at least `rank` items.
 */
template<typename Shape, typename Min, typename Extent>
void check_region_bounds(
    const char* array_name,
    const Shape& shape,
    const Min& min,
    const Extent& extent,
    size_t rank) {
    for (size_t i = 0; i < rank; i++) {
        if (!compare_greater(extent[i], 0)) {
            return;
        }
    }

    for (size_t i = 0; i < rank; i++) {
        if (!axis_in_bounds(shape.size(i), min[i], extent[i])) {
            throw BoundsViolation(
                array_name,
                i,
                static_cast<size_t>(min[i]),
                static_cast<size_t>(extent[i]),
                static_cast<size_t>(shape.size(i)));
        }
    }
}

}  // namespace ndcopy
