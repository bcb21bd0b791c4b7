#pragma once

#include <cstddef>
#include <initializer_list>
#include <type_traits>

#include "shape.hpp"

#include "ndcopy/utils/small_vector.hpp"

namespace ndcopy {

/**
 * Index or extent whose number of axes is only known at run time.
 */
using RuntimeIndex = small_vector<size_t, 4>;

template<typename T, size_t N>
RuntimeIndex to_runtime_index(const fixed_array<T, N>& index) {
    RuntimeIndex result;

    for (size_t i = 0; i < N; i++) {
        result.push_back(checked_cast<size_t>(index[i]));
    }

    return result;
}

/**
 * Shape whose rank is only known at run time. Any static or dynamic shape converts implicitly
 * into a `RuntimeShape`, which is what allows copies between different kinds of shapes through
 * the runtime-rank entry points.
 */
class RuntimeShape {
  public:
    using index_type = size_t;

    RuntimeShape(RuntimeIndex sizes);

    RuntimeShape(std::initializer_list<size_t> sizes) : RuntimeShape(RuntimeIndex(sizes)) {}

    template<typename S, typename = std::enable_if_t<is_shape_v<S>>>
    RuntimeShape(const S& shape) : RuntimeShape(sizes_of(shape)) {}

    size_t rank() const noexcept {
        return m_sizes.size();
    }

    size_t size(size_t axis) const noexcept {
        return m_sizes[axis];
    }

    size_t stride(size_t axis) const noexcept {
        return m_strides[axis];
    }

    size_t total_size() const noexcept {
        return m_total_size;
    }

    const RuntimeIndex& sizes() const noexcept {
        return m_sizes;
    }

    const RuntimeIndex& strides() const noexcept {
        return m_strides;
    }

    /**
     * Returns the offset of `index`. Throws `DimensionMismatch` if `index` does not have `rank()`
     * axes.
     */
    size_t linearize(const RuntimeIndex& index) const;

    /**
     * Inverse of `linearize`. Throws `std::out_of_range` if `offset >= total_size()`.
     */
    RuntimeIndex delinearize(size_t offset) const;

  private:
    template<typename S>
    static RuntimeIndex sizes_of(const S& shape) {
        RuntimeIndex result;

        for (size_t i = 0; i < S::rank; i++) {
            result.push_back(checked_cast<size_t>(shape.size(i)));
        }

        return result;
    }

    RuntimeIndex m_sizes;
    RuntimeIndex m_strides;
    size_t m_total_size = 1;
};

}  // namespace ndcopy
