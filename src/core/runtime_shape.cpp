#include <stdexcept>
#include <utility>

#include "fmt/format.h"

#include "ndcopy/core/runtime_shape.hpp"
#include "ndcopy/utils/checked_math.hpp"

namespace ndcopy {

RuntimeShape::RuntimeShape(RuntimeIndex sizes) : m_sizes(std::move(sizes)) {
    size_t rank = m_sizes.size();
    size_t stride = 1;

    m_strides.resize(rank);

    for (size_t i = rank; i > 0; i--) {
        m_strides[i - 1] = stride;
        stride = checked_mul(stride, m_sizes[i - 1]);
    }

    m_total_size = stride;
}

size_t RuntimeShape::linearize(const RuntimeIndex& index) const {
    if (index.size() != rank()) {
        throw DimensionMismatch("index", rank(), index.size());
    }

    size_t offset = 0;

    for (size_t i = 0; i < rank(); i++) {
        offset += m_strides[i] * index[i];
    }

    return offset;
}

RuntimeIndex RuntimeShape::delinearize(size_t offset) const {
    if (offset >= m_total_size) {
        throw std::out_of_range(
            fmt::format("offset {} is out of range for shape {}", offset, m_sizes));
    }

    RuntimeIndex result(rank(), 0);

    for (size_t i = 0; i < rank(); i++) {
        result[i] = offset / m_strides[i];
        offset %= m_strides[i];
    }

    return result;
}

}  // namespace ndcopy
