#pragma once

#include <cstddef>

#include "geometry.hpp"

#include "ndcopy/utils/macros.hpp"
#include "ndcopy/utils/small_vector.hpp"

namespace ndcopy {

namespace detail {

/**
 * Visits the start of every innermost row of a region. The loop nest is written out by hand for
 * one to four axes; more axes use an odometer over the outer axes.
 */
template<size_t N>
struct RowWalker {
    template<typename T, typename F>
    static void run(const Size<N, T>& extent, F& fun) {
        Index<N, T> row = Index<N, T>::zero();

        while (true) {
            fun(static_cast<const Index<N, T>&>(row));

            size_t axis = N - 1;

            for (; axis > 0; axis--) {
                T& coordinate = row[axis - 1];
                coordinate++;

                if (coordinate < extent[axis - 1]) {
                    break;
                }

                coordinate = static_cast<T>(0);
            }

            if (axis == 0) {
                return;
            }
        }
    }
};

template<>
struct RowWalker<1> {
    template<typename T, typename F>
    NDCOPY_INLINE static void run(const Size<1, T>& extent, F& fun) {
        fun(Index<1, T>::zero());
    }
};

template<>
struct RowWalker<2> {
    template<typename T, typename F>
    NDCOPY_INLINE static void run(const Size<2, T>& extent, F& fun) {
        for (T i = 0; i < extent[0]; i++) {
            fun(Index<2, T> {i, T {0}});
        }
    }
};

template<>
struct RowWalker<3> {
    template<typename T, typename F>
    NDCOPY_INLINE static void run(const Size<3, T>& extent, F& fun) {
        for (T i = 0; i < extent[0]; i++) {
            for (T j = 0; j < extent[1]; j++) {
                fun(Index<3, T> {i, j, T {0}});
            }
        }
    }
};

template<>
struct RowWalker<4> {
    template<typename T, typename F>
    NDCOPY_INLINE static void run(const Size<4, T>& extent, F& fun) {
        for (T i = 0; i < extent[0]; i++) {
            for (T j = 0; j < extent[1]; j++) {
                for (T k = 0; k < extent[2]; k++) {
                    fun(Index<4, T> {i, j, k, T {0}});
                }
            }
        }
    }
};

}  // namespace detail

/**
 * Calls `fun(row)` once for every innermost row of a region with the given `extent`. `row` is the
 * coordinate of the first cell of the row relative to the region's minimum corner, so its last
 * component is always zero. The rows are visited in row-major order and the number of calls is
 * the product of all extents except the last one. An empty extent visits nothing.
 */
template<size_t N, typename T, typename F>
NDCOPY_INLINE void for_each_row(const Size<N, T>& extent, F&& fun) {
    if (extent.is_empty()) {
        return;
    }

    detail::RowWalker<N>::run(extent, fun);
}

/**
 * Walks the rows of a byte-level descriptor with `K` operands. `counts` and every `strides[k]`
 * hold `num_axes` items, outermost first. Calls `fun(offsets)` with the byte offset of the start of
 * the current row for each operand, advancing offsets incrementally instead of linearizing every
 * row.
 */
template<size_t K, typename F>
void for_each_strided_row(
    size_t num_axes,
    const size_t* counts,
    const fixed_array<const size_t*, K>& strides,
    fixed_array<size_t, K> offsets,
    F&& fun) {
    for (size_t i = 0; i < num_axes; i++) {
        if (counts[i] == 0) {
            return;
        }
    }

    small_vector<size_t, 4> position(num_axes, 0);

    while (true) {
        fun(static_cast<const fixed_array<size_t, K>&>(offsets));

        size_t axis = num_axes;

        for (; axis > 0; axis--) {
            size_t i = axis - 1;
            position[i]++;

            for (size_t k = 0; k < K; k++) {
                offsets[k] += strides[k][i];
            }

            if (position[i] < counts[i]) {
                break;
            }

            for (size_t k = 0; k < K; k++) {
                offsets[k] -= counts[i] * strides[k][i];
            }

            position[i] = 0;
        }

        if (axis == 0) {
            return;
        }
    }
}

}  // namespace ndcopy
