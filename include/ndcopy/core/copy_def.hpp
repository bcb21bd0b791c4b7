#pragma once

#include <cstddef>

#include "rows.hpp"
#include "runtime_shape.hpp"

#include "ndcopy/utils/small_vector.hpp"

namespace ndcopy {

/**
 * Byte-level description of a copy between two strided buffers. Axes are ordered outermost
 * first; offsets and strides are in bytes. When the innermost axis is contiguous in both buffers
 * (its strides equal `element_size`), every run along it is copied as a single row. Otherwise
 * every element is its own row.
 */
class CopyDef {
  public:
    CopyDef(size_t element_size = 0) : element_size(element_size) {}

    /**
     * Describes copying the region of `extent` cells starting at `src_min` in an array with shape
     * `src_shape` to the region starting at `dst_min` in an array with shape `dst_shape`.
     *
     * Throws `DimensionMismatch` if the operands do not all have the same number of axes and
     * `BoundsViolation` if either region does not fit inside its array.
     */
    static CopyDef from_shapes(
        size_t element_size,
        const RuntimeIndex& extent,
        const RuntimeShape& src_shape,
        const RuntimeIndex& src_min,
        const RuntimeShape& dst_shape,
        const RuntimeIndex& dst_min);

    /**
     * Adds an axis inside all axes added so far. The offsets and strides are given in elements.
     */
    void add_dimension(
        size_t count,
        size_t src_offset,
        size_t dst_offset,
        size_t src_stride,
        size_t dst_stride);

    size_t rank() const {
        return counts.size();
    }

    bool is_empty() const;
    bool is_innermost_contiguous() const;
    size_t effective_dimensionality() const;
    size_t row_bytes() const;
    size_t number_of_rows() const;
    size_t number_of_bytes_copied() const;
    size_t minimum_source_bytes_needed() const;
    size_t minimum_destination_bytes_needed() const;

    /**
     * Calls `fun(src_offset, dst_offset)` with the byte offsets of every row, in row-major order.
     * Each row is `row_bytes()` long.
     */
    template<typename F>
    void for_each_row(F&& fun) const {
        if (is_empty()) {
            return;
        }

        for_each_strided_row<2>(
            number_of_outer_axes(),
            counts.data(),
            {src_strides.data(), dst_strides.data()},
            {src_offset, dst_offset},
            [&](const fixed_array<size_t, 2>& offsets) { fun(offsets[0], offsets[1]); });
    }

    size_t element_size = 0;
    size_t src_offset = 0;
    size_t dst_offset = 0;
    small_vector<size_t, 4> counts;
    small_vector<size_t, 4> src_strides;
    small_vector<size_t, 4> dst_strides;

  private:
    size_t number_of_outer_axes() const;
};

}  // namespace ndcopy
