#pragma once

#include <cstddef>

namespace ndcopy {

constexpr bool is_less(size_t a, size_t b) {
    return a < b;
}

template<typename T, size_t N>
struct fixed_array {
    constexpr T& operator[](size_t axis) {
        return item[axis];
    }

    constexpr const T& operator[](size_t axis) const {
        return item[axis];
    }

    T item[N] = {};
};

template<typename T>
struct fixed_array<T, 1> {
    constexpr T& operator[](size_t axis) {
        return x;
    }

    constexpr const T& operator[](size_t axis) const {
        return x;
    }

    T x {};
};

template<typename T>
struct fixed_array<T, 2> {
    constexpr T& operator[](size_t axis) {
        switch (axis) {
            case 0:
                return x;
            default:
                return y;
        }
    }

    constexpr const T& operator[](size_t axis) const {
        switch (axis) {
            case 0:
                return x;
            default:
                return y;
        }
    }

    T x {};
    T y {};
};

template<typename T>
struct fixed_array<T, 3> {
    constexpr T& operator[](size_t axis) {
        switch (axis) {
            case 0:
                return x;
            case 1:
                return y;
            default:
                return z;
        }
    }

    constexpr const T& operator[](size_t axis) const {
        switch (axis) {
            case 0:
                return x;
            case 1:
                return y;
            default:
                return z;
        }
    }

    T x {};
    T y {};
    T z {};
};

template<typename T>
struct fixed_array<T, 4> {
    constexpr T& operator[](size_t axis) {
        switch (axis) {
            case 0:
                return x;
            case 1:
                return y;
            case 2:
                return z;
            default:
                return w;
        }
    }

    constexpr const T& operator[](size_t axis) const {
        switch (axis) {
            case 0:
                return x;
            case 1:
                return y;
            case 2:
                return z;
            default:
                return w;
        }
    }

    T x {};
    T y {};
    T z {};
    T w {};
};

template<typename T, size_t N, typename U, size_t M>
constexpr bool operator==(const fixed_array<T, N>& lhs, const fixed_array<U, M>& rhs) {
    if constexpr (N != M) {
        return false;
    } else {
        bool result = true;

        for (size_t i = 0; is_less(i, N); i++) {
            result &= lhs[i] == rhs[i];
        }

        return result;
    }
}

template<typename T, size_t N, typename U, size_t M>
constexpr bool operator!=(const fixed_array<T, N>& lhs, const fixed_array<U, M>& rhs) {
    return !(lhs == rhs);
}

}  // namespace ndcopy

#include <iostream>

#include "fmt/ostream.h"

namespace ndcopy {

template<typename T, size_t N>
std::ostream& operator<<(std::ostream& stream, const fixed_array<T, N>& p) {
    stream << "{";
    for (size_t i = 0; is_less(i, N); i++) {
        if (i != 0) {
            stream << ", ";
        }

        stream << p[i];
    }

    return stream << "}";
}

}  // namespace ndcopy

template<typename T, size_t N>
struct fmt::formatter<ndcopy::fixed_array<T, N>>: fmt::ostream_formatter {};
