#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

namespace ndcopy {

/**
 * Vector that stores up to `InlineSize` items in place and only moves to the heap beyond that.
 * Index lists of arrays almost never exceed four axes, so the common case does not allocate.
 */
template<typename T, size_t InlineSize>
struct small_vector {
    using capacity_type = uint32_t;

    small_vector() = default;

    small_vector(const small_vector& that) {
        insert_all(that.begin(), that.end());
    }

    small_vector(small_vector&& that) noexcept {
        *this = std::move(that);
    }

    small_vector(std::initializer_list<T> items) {
        insert_all(items.begin(), items.end());
    }

    small_vector(size_t n, const T& value) {
        resize(n, value);
    }

    small_vector& operator=(const small_vector& that) {
        if (this != &that) {
            clear();
            insert_all(that.begin(), that.end());
        }

        return *this;
    }

    small_vector& operator=(small_vector&& that) noexcept {
        std::swap(this->m_inline_data, that.m_inline_data);
        std::swap(this->m_size, that.m_size);
        std::swap(this->m_capacity, that.m_capacity);
        std::swap(this->m_data, that.m_data);

        if (!this->is_heap_allocated()) {
            this->m_data = this->m_inline_data;
        }

        if (!that.is_heap_allocated()) {
            that.m_data = that.m_inline_data;
        }

        return *this;
    }

    ~small_vector() {
        if (is_heap_allocated()) {
            delete[] m_data;
        }
    }

    size_t capacity() const noexcept {
        return m_capacity;
    }

    size_t size() const noexcept {
        return m_size;
    }

    bool is_empty() const noexcept {
        return m_size == 0;
    }

    void clear() noexcept {
        m_size = 0;
    }

    bool is_heap_allocated() const noexcept {
        return m_capacity > InlineSize;
    }

    T* data() noexcept {
        return m_data;
    }

    const T* data() const noexcept {
        return m_data;
    }

    void reserve(size_t n) {
        if (n <= m_capacity) {
            return;
        }

        if (n > std::numeric_limits<capacity_type>::max()) {
            throw std::overflow_error("small_vector exceeds capacity");
        }

        capacity_type new_capacity = m_capacity < 16 ? 16 : m_capacity;

        while (new_capacity < n) {
            if (new_capacity > std::numeric_limits<capacity_type>::max() / 2) {
                new_capacity = static_cast<capacity_type>(n);
                break;
            }

            new_capacity *= 2;
        }

        auto new_data = std::make_unique<T[]>(new_capacity);

        for (size_t i = 0; i < m_size; i++) {
            new_data[i] = std::move(m_data[i]);
        }

        if (is_heap_allocated()) {
            delete[] m_data;
        }

        m_capacity = new_capacity;
        m_data = new_data.release();
    }

    void push_back(T item) {
        if (m_capacity <= m_size) {
            reserve(size_t(m_size) + 1);
        }

        m_data[m_size] = std::move(item);
        m_size++;
    }

    template<typename It>
    void insert_all(It begin, It end) {
        size_t n = static_cast<size_t>(end - begin);
        reserve(size_t(m_size) + n);

        for (size_t i = 0; i < n; i++) {
            m_data[m_size + i] = begin[i];
        }

        // This is safe since `m_size + n <= m_capacity`
        m_size += static_cast<capacity_type>(n);
    }

    void resize(size_t n, const T& value = T {}) {
        reserve(n);

        for (size_t i = m_size; i < n; i++) {
            m_data[i] = value;
        }

        // Safe since `n <= m_capacity`
        m_size = static_cast<capacity_type>(n);
    }

    T& operator[](size_t i) noexcept {
        return *(data() + i);
    }

    const T& operator[](size_t i) const noexcept {
        return *(data() + i);
    }

    T& back() noexcept {
        return m_data[m_size - 1];
    }

    const T& back() const noexcept {
        return m_data[m_size - 1];
    }

    T* begin() noexcept {
        return data();
    }

    T* end() noexcept {
        return data() + size();
    }

    const T* begin() const noexcept {
        return data();
    }

    const T* end() const noexcept {
        return data() + size();
    }

  private:
    capacity_type m_size = 0;
    capacity_type m_capacity = InlineSize;
    T m_inline_data[InlineSize] = {};
    T* m_data = m_inline_data;
};

template<typename T, size_t N, size_t M>
bool operator==(const small_vector<T, N>& lhs, const small_vector<T, M>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); i++) {
        if (!(lhs[i] == rhs[i])) {
            return false;
        }
    }

    return true;
}

template<typename T, size_t N, size_t M>
bool operator!=(const small_vector<T, N>& lhs, const small_vector<T, M>& rhs) {
    return !(lhs == rhs);
}

using small_buffer = small_vector<uint8_t, sizeof(uint64_t)>;

}  // namespace ndcopy

#include <iostream>

#include "fmt/ostream.h"

namespace ndcopy {

template<typename T, size_t N>
std::ostream& operator<<(std::ostream& stream, const small_vector<T, N>& v) {
    stream << "[";
    for (size_t i = 0; i < v.size(); i++) {
        if (i != 0) {
            stream << ", ";
        }

        stream << v[i];
    }

    return stream << "]";
}

}  // namespace ndcopy

template<typename T, size_t N>
struct fmt::formatter<ndcopy::small_vector<T, N>>: fmt::ostream_formatter {};
