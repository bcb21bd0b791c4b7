#include "ndcopy/core/errors.hpp"
#include "ndcopy/core/fill_def.hpp"
#include "ndcopy/utils/checked_math.hpp"

namespace ndcopy {

FillDef FillDef::from_shape(
    size_t element_size,
    const void* fill_value,
    const RuntimeIndex& extent,
    const RuntimeShape& dst_shape,
    const RuntimeIndex& dst_min) {
    size_t rank = extent.size();

    if (dst_shape.rank() != rank) {
        throw DimensionMismatch("destination shape", rank, dst_shape.rank());
    }

    if (dst_min.size() != rank) {
        throw DimensionMismatch("destination offset", rank, dst_min.size());
    }

    check_region_bounds("destination", dst_shape, dst_min, extent, rank);

    FillDef result {element_size, fill_value};

    for (size_t i = 0; i < rank; i++) {
        result.add_dimension(extent[i], 0, dst_shape.stride(i));
    }

    if (!result.is_empty()) {
        result.dst_offset = checked_mul(dst_shape.linearize(dst_min), element_size);
    }

    return result;
}

void FillDef::add_dimension(size_t count, size_t dst_offset, size_t dst_stride) {
    size_t dst_stride_bytes = checked_mul(dst_stride, element_size());

    if (count > 0) {
        this->dst_offset = checked_add(this->dst_offset, checked_mul(dst_offset, dst_stride_bytes));
    }

    counts.push_back(count);
    dst_strides.push_back(dst_stride_bytes);
}

bool FillDef::is_empty() const {
    if (fill_value.is_empty()) {
        return true;
    }

    for (size_t count : counts) {
        if (count == 0) {
            return true;
        }
    }

    return false;
}

bool FillDef::is_innermost_contiguous() const {
    return !counts.is_empty() && dst_strides.back() == element_size();
}

size_t FillDef::elements_per_row() const {
    if (is_empty()) {
        return 0;
    }

    return is_innermost_contiguous() ? counts.back() : 1;
}

size_t FillDef::number_of_rows() const {
    if (is_empty()) {
        return 0;
    }

    size_t outer = is_innermost_contiguous() ? counts.size() - 1 : counts.size();
    return checked_product(counts.begin(), counts.begin() + outer);
}

}  // namespace ndcopy
