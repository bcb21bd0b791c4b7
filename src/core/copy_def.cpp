#include <cstddef>

#include "ndcopy/core/copy_def.hpp"
#include "ndcopy/core/errors.hpp"
#include "ndcopy/utils/checked_math.hpp"

namespace ndcopy {

CopyDef CopyDef::from_shapes(
    size_t element_size,
    const RuntimeIndex& extent,
    const RuntimeShape& src_shape,
    const RuntimeIndex& src_min,
    const RuntimeShape& dst_shape,
    const RuntimeIndex& dst_min) {
    size_t rank = extent.size();

    if (src_shape.rank() != rank) {
        throw DimensionMismatch("source shape", rank, src_shape.rank());
    }

    if (src_min.size() != rank) {
        throw DimensionMismatch("source offset", rank, src_min.size());
    }

    if (dst_shape.rank() != rank) {
        throw DimensionMismatch("destination shape", rank, dst_shape.rank());
    }

    if (dst_min.size() != rank) {
        throw DimensionMismatch("destination offset", rank, dst_min.size());
    }

    check_region_bounds("source", src_shape, src_min, extent, rank);
    check_region_bounds("destination", dst_shape, dst_min, extent, rank);

    CopyDef result {element_size};

    for (size_t i = 0; i < rank; i++) {
        result.add_dimension(extent[i], 0, 0, src_shape.stride(i), dst_shape.stride(i));
    }

    // The minimum corners of an empty region may lie anywhere, there is nothing to offset.
    if (!result.is_empty()) {
        result.src_offset = checked_mul(src_shape.linearize(src_min), element_size);
        result.dst_offset = checked_mul(dst_shape.linearize(dst_min), element_size);
    }

    return result;
}

void CopyDef::add_dimension(
    size_t count,
    size_t src_offset,
    size_t dst_offset,
    size_t src_stride,
    size_t dst_stride) {
    size_t src_stride_bytes = checked_mul(src_stride, element_size);
    size_t dst_stride_bytes = checked_mul(dst_stride, element_size);

    if (count > 0) {
        this->src_offset = checked_add(this->src_offset, checked_mul(src_offset, src_stride_bytes));
        this->dst_offset = checked_add(this->dst_offset, checked_mul(dst_offset, dst_stride_bytes));
    }

    counts.push_back(count);
    src_strides.push_back(src_stride_bytes);
    dst_strides.push_back(dst_stride_bytes);
}

bool CopyDef::is_empty() const {
    if (element_size == 0) {
        return true;
    }

    for (size_t count : counts) {
        if (count == 0) {
            return true;
        }
    }

    return false;
}

bool CopyDef::is_innermost_contiguous() const {
    return !counts.is_empty() && src_strides.back() == element_size
        && dst_strides.back() == element_size;
}

size_t CopyDef::number_of_outer_axes() const {
    return is_innermost_contiguous() ? rank() - 1 : rank();
}

size_t CopyDef::effective_dimensionality() const {
    for (size_t n = rank(); n > 0; n--) {
        if (counts[rank() - n] != 1) {
            return n;
        }
    }

    return 0;
}

size_t CopyDef::row_bytes() const {
    if (is_empty()) {
        return 0;
    }

    if (is_innermost_contiguous()) {
        return checked_mul(counts.back(), element_size);
    }

    return element_size;
}

size_t CopyDef::number_of_rows() const {
    if (is_empty()) {
        return 0;
    }

    return checked_product(counts.begin(), counts.begin() + number_of_outer_axes());
}

size_t CopyDef::number_of_bytes_copied() const {
    if (is_empty()) {
        return 0;
    }

    return checked_mul(checked_product(counts.begin(), counts.end()), element_size);
}

size_t CopyDef::minimum_source_bytes_needed() const {
    if (is_empty()) {
        return 0;
    }

    size_t result = checked_add(src_offset, element_size);

    for (size_t i = 0; i < rank(); i++) {
        result = checked_add(result, checked_mul(counts[i] - 1, src_strides[i]));
    }

    return result;
}

size_t CopyDef::minimum_destination_bytes_needed() const {
    if (is_empty()) {
        return 0;
    }

    size_t result = checked_add(dst_offset, element_size);

    for (size_t i = 0; i < rank(); i++) {
        result = checked_add(result, checked_mul(counts[i] - 1, dst_strides[i]));
    }

    return result;
}

}  // namespace ndcopy
