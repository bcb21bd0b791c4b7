#pragma once

#include <cstddef>
#include <cstdint>

#include "rows.hpp"
#include "runtime_shape.hpp"

#include "ndcopy/utils/small_vector.hpp"

namespace ndcopy {

/**
 * Byte-level description of writing one value into every cell of a strided region. Axes are
 * ordered outermost first; the offset and strides are in bytes.
 */
class FillDef {
  public:
    FillDef(size_t element_size, const void* fill_value) {
        this->fill_value.insert_all(
            reinterpret_cast<const uint8_t*>(fill_value),
            reinterpret_cast<const uint8_t*>(fill_value) + element_size
        );
    }

    /**
     * Describes filling the region of `extent` cells starting at `dst_min` in an array with shape
     * `dst_shape`. Throws `DimensionMismatch` or `BoundsViolation` like `CopyDef::from_shapes`.
     */
    static FillDef from_shape(
        size_t element_size,
        const void* fill_value,
        const RuntimeIndex& extent,
        const RuntimeShape& dst_shape,
        const RuntimeIndex& dst_min);

    /**
     * Adds an axis inside all axes added so far. The offset and stride are given in elements.
     */
    void add_dimension(size_t count, size_t dst_offset, size_t dst_stride);

    size_t element_size() const {
        return fill_value.size();
    }

    bool is_empty() const;
    bool is_innermost_contiguous() const;
    size_t elements_per_row() const;
    size_t number_of_rows() const;

    /**
     * Calls `fun(dst_offset)` with the byte offset of every row. Each row holds
     * `elements_per_row()` elements.
     */
    template<typename F>
    void for_each_row(F&& fun) const {
        if (is_empty()) {
            return;
        }

        for_each_strided_row<1>(
            is_innermost_contiguous() ? counts.size() - 1 : counts.size(),
            counts.data(),
            {dst_strides.data()},
            {dst_offset},
            [&](const fixed_array<size_t, 1>& offsets) { fun(offsets[0]); });
    }

    size_t dst_offset = 0;
    small_vector<size_t, 4> counts;
    small_vector<size_t, 4> dst_strides;
    small_buffer fill_value;
};

}  // namespace ndcopy
