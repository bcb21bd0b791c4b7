#pragma once

#include <cstddef>
#include <exception>
#include <string>

namespace ndcopy {

/**
 * Exception thrown if a region, given by its minimum corner and its extent, does not fit inside
 * the array it addresses.
 */
class BoundsViolation: public std::exception {
  public:
    BoundsViolation(
        const char* array_name,
        size_t axis,
        size_t offset,
        size_t extent,
        size_t size);

    const char* what() const noexcept override;

    size_t axis() const noexcept {
        return m_axis;
    }

  private:
    std::string m_message;
    size_t m_axis;
};

/**
 * Exception thrown if the number of dimensions of two operands of a copy or fill do not agree.
 */
class DimensionMismatch: public std::exception {
  public:
    DimensionMismatch(const char* operand_name, size_t expected, size_t actual);

    const char* what() const noexcept override;

    size_t expected() const noexcept {
        return m_expected;
    }

    size_t actual() const noexcept {
        return m_actual;
    }

  private:
    std::string m_message;
    size_t m_expected;
    size_t m_actual;
};

}  // namespace ndcopy
