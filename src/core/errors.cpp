#include "fmt/format.h"

#include "ndcopy/core/errors.hpp"

namespace ndcopy {

BoundsViolation::BoundsViolation(
    const char* array_name,
    size_t axis,
    size_t offset,
    size_t extent,
    size_t size) :
    m_axis(axis) {
    m_message = fmt::format(
        "{} region exceeds array bounds along axis {}: offset {} plus extent {} exceeds size {}",
        array_name,
        axis,
        offset,
        extent,
        size);
}

const char* BoundsViolation::what() const noexcept {
    return m_message.c_str();
}

DimensionMismatch::DimensionMismatch(const char* operand_name, size_t expected, size_t actual) :
    m_expected(expected),
    m_actual(actual) {
    m_message = fmt::format(
        "dimension mismatch: expecting {} to have {} dimension(s), but it has {}",
        operand_name,
        expected,
        actual);
}

const char* DimensionMismatch::what() const noexcept {
    return m_message.c_str();
}

}  // namespace ndcopy
