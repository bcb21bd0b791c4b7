#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "fixed_array.hpp"

#include "ndcopy/utils/macros.hpp"

namespace ndcopy {

using default_index_type = size_t;

/**
 * A position in the index space of an N-dimensional array. Used for the minimum corner of the
 * region that is copied.
 */
template<size_t N, typename T = default_index_type>
class Index: public fixed_array<T, N> {
    static_assert(N > 0, "an index must have at least one axis");

  public:
    using storage_type = fixed_array<T, N>;

    explicit constexpr Index(const storage_type& storage) : storage_type(storage) {}

    constexpr Index() {
        for (size_t i = 0; i < N; i++) {
            (*this)[i] = T {};
        }
    }

    template<typename... Ts, typename = typename std::enable_if<(sizeof...(Ts) < N)>::type>
    constexpr Index(T first, Ts&&... args) : Index() {
        (*this)[0] = first;

        size_t index = 0;
        (((*this)[++index] = static_cast<T>(args)), ...);
    }

    template<size_t M, typename U>
    static constexpr Index from(const fixed_array<U, M>& that) {
        Index result;

        for (size_t i = 0; i < N && is_less(i, M); i++) {
            result[i] = static_cast<T>(that[i]);
        }

        return result;
    }

    static constexpr Index fill(T value) {
        Index result;

        for (size_t i = 0; i < N; i++) {
            result[i] = value;
        }

        return result;
    }

    static constexpr Index zero() {
        return fill(static_cast<T>(0));
    }

    static constexpr Index one() {
        return fill(static_cast<T>(1));
    }

    constexpr T get(size_t axis) const {
        return NDCOPY_LIKELY(axis < N) ? (*this)[axis] : static_cast<T>(0);
    }

    constexpr T operator()(size_t axis = 0) const {
        return get(axis);
    }
};

/**
 * The number of cells along each axis of an N-dimensional region. Used for the extent of the
 * region that is copied.
 */
template<size_t N, typename T = default_index_type>
class Size: public fixed_array<T, N> {
    static_assert(N > 0, "a size must have at least one axis");

  public:
    using storage_type = fixed_array<T, N>;

    explicit constexpr Size(const storage_type& storage) : storage_type(storage) {}

    constexpr Size() {
        for (size_t i = 0; i < N; i++) {
            (*this)[i] = static_cast<T>(1);
        }
    }

    template<typename... Ts, typename = typename std::enable_if<(sizeof...(Ts) < N)>::type>
    constexpr Size(T first, Ts&&... args) : Size() {
        (*this)[0] = first;

        size_t index = 0;
        (((*this)[++index] = static_cast<T>(args)), ...);
    }

    static constexpr Size from_point(const Index<N, T>& that) {
        return Size {that};
    }

    template<size_t M, typename U>
    static constexpr Size from(const fixed_array<U, M>& that) {
        Size result;

        for (size_t i = 0; i < N && is_less(i, M); i++) {
            result[i] = static_cast<T>(that[i]);
        }

        return result;
    }

    static constexpr Size zero() {
        return from_point(Index<N, T>::zero());
    }

    static constexpr Size one() {
        return from_point(Index<N, T>::one());
    }

    constexpr Index<N, T> to_point() const {
        return Index<N, T>::from(*this);
    }

    constexpr bool is_empty() const {
        bool is_empty = false;

        for (size_t i = 0; i < N; i++) {
            is_empty |= (*this)[i] <= static_cast<T>(0);
        }

        return is_empty;
    }

    constexpr T get(size_t axis) const {
        return NDCOPY_LIKELY(axis < N) ? (*this)[axis] : static_cast<T>(1);
    }

    constexpr T volume() const {
        if (is_empty()) {
            return static_cast<T>(0);
        }

        T volume = (*this)[0];

        for (size_t i = 1; i < N; i++) {
            volume *= (*this)[i];
        }

        return volume;
    }

    /**
     * Returns `true` if `that` lies inside the box `[0, size)`.
     */
    constexpr bool contains(const Index<N, T>& that) const {
        for (size_t i = 0; i < N; i++) {
            if (that[i] < static_cast<T>(0) || that[i] >= (*this)[i]) {
                return false;
            }
        }

        return true;
    }

    constexpr T operator()(size_t axis = 0) const {
        return get(axis);
    }
};

template<typename... Ts>
Index(Ts...) -> Index<sizeof...(Ts)>;

template<typename... Ts>
Size(Ts...) -> Size<sizeof...(Ts)>;

template<size_t N, typename T>
constexpr bool operator==(const Index<N, T>& a, const Index<N, T>& b) {
    return (const fixed_array<T, N>&)a == (const fixed_array<T, N>&)b;
}

template<size_t N, typename T>
constexpr bool operator!=(const Index<N, T>& a, const Index<N, T>& b) {
    return !(a == b);
}

template<size_t N, typename T>
constexpr bool operator==(const Size<N, T>& a, const Size<N, T>& b) {
    return (const fixed_array<T, N>&)a == (const fixed_array<T, N>&)b;
}

template<size_t N, typename T>
constexpr bool operator!=(const Size<N, T>& a, const Size<N, T>& b) {
    return !(a == b);
}

#define NDCOPY_INDEX_OPERATOR_IMPL(OP)                                                         \
    template<size_t N, typename T>                                                             \
    constexpr Index<N, T> operator OP(const Index<N, T>& a, const Index<N, T>& b) {            \
        Index<N, T> result;                                                                    \
        for (size_t i = 0; i < N; i++) {                                                       \
            result[i] = a[i] OP b[i];                                                          \
        }                                                                                      \
                                                                                               \
        return result;                                                                         \
    }

NDCOPY_INDEX_OPERATOR_IMPL(+)
NDCOPY_INDEX_OPERATOR_IMPL(-)
NDCOPY_INDEX_OPERATOR_IMPL(*)
NDCOPY_INDEX_OPERATOR_IMPL(/)

#undef NDCOPY_INDEX_OPERATOR_IMPL

}  // namespace ndcopy

#include <iosfwd>

namespace ndcopy {

template<size_t N, typename T>
std::ostream& operator<<(std::ostream& stream, const Index<N, T>& p) {
    return stream << fixed_array<T, N>(p);
}

template<size_t N, typename T>
std::ostream& operator<<(std::ostream& stream, const Size<N, T>& p) {
    return stream << fixed_array<T, N>(p);
}

}  // namespace ndcopy

#include "fmt/ostream.h"

template<size_t N, typename T>
struct fmt::formatter<ndcopy::Index<N, T>>: fmt::ostream_formatter {};

template<size_t N, typename T>
struct fmt::formatter<ndcopy::Size<N, T>>: fmt::ostream_formatter {};
