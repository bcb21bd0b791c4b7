#pragma once

#include <cstddef>
#include <limits>
#include <type_traits>

namespace ndcopy {

namespace detail {

template<typename L, typename R, typename = void>
struct checked_compare_impl {
    static constexpr bool is_less(const L& left, const R& right) {
        return left < right;
    }
};

template<typename L, typename R>
struct checked_compare_impl<L, R, std::enable_if_t<!std::is_signed_v<L> && std::is_signed_v<R>>> {
    using UR = std::make_unsigned_t<R>;

    static constexpr bool is_less(const L& left, const R& right) {
        return right >= static_cast<R>(0)
            && checked_compare_impl<L, UR>::is_less(left, static_cast<UR>(right));
    }
};

template<typename L, typename R>
struct checked_compare_impl<L, R, std::enable_if_t<std::is_signed_v<L> && !std::is_signed_v<R>>> {
    using UL = std::make_unsigned_t<L>;

    static constexpr bool is_less(const L& left, const R& right) {
        return left < static_cast<L>(0)
            || checked_compare_impl<UL, R>::is_less(static_cast<UL>(left), right);
    }
};

}  // namespace detail

[[noreturn]] void throw_overflow_exception();

/**
 *  Performs checked addition of two values, throwing an exception on overflow.
 */
template<typename T>
T checked_add(T left, T right) {
    static_assert(std::is_integral_v<T>, "checked arithmetic requires an integral type");
    T result;

    if (__builtin_add_overflow(left, right, &result)) {
        throw_overflow_exception();
    }

    return result;
}

/**
 *  Performs checked multiplication of two values, throwing an exception on overflow.
 */
template<typename T>
T checked_mul(T left, T right) {
    static_assert(std::is_integral_v<T>, "checked arithmetic requires an integral type");
    T result;

    if (__builtin_mul_overflow(left, right, &result)) {
        throw_overflow_exception();
    }

    return result;
}

/**
 * Returns true if `left < right`. This function correctly handles different operand types.
 */
template<typename L, typename R>
constexpr bool compare_less(const L& left, const R& right) {
    return detail::checked_compare_impl<L, R>::is_less(left, right);
}

/**
 * Returns true if `left > right`. This function correctly handles different operand types.
 */
template<typename L, typename R>
constexpr bool compare_greater(const L& left, const R& right) {
    return compare_less(right, left);
}

/**
 * Returns `true` if the given value of integral type `T` can safely be cast to another integral
 * type `U`, and `false` otherwise.
 */
template<typename U, typename T>
constexpr bool in_range(const T& value) {
    return !compare_less(value, std::numeric_limits<U>::lowest())
        && !compare_greater(value, std::numeric_limits<U>::max());
}

/**
 * Performs a checked cast of a value of type `T` to a different type `U`, throwing an exception if
 * the value is out of range for type `U`.
 */
template<typename U, typename T>
U checked_cast(const T& value) {
    if (!in_range<U>(value)) {
        throw_overflow_exception();
    }

    return static_cast<U>(value);
}

/**
 * Computes the product of an array of values, throwing an exception on overflow. The product of
 * an empty range is one.
 */
template<typename U, typename T>
U checked_product(const T* begin, const T* end) {
    U result = static_cast<U>(1);

    for (const T* it = begin; it != end; it++) {
        result = checked_mul(result, checked_cast<U>(*it));
    }

    return result;
}

template<typename T>
T checked_product(const T* begin, const T* end) {
    return checked_product<T, T>(begin, end);
}

}  // namespace ndcopy
