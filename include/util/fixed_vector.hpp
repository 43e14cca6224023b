#ifndef FIXED_VECTOR_HPP
#define FIXED_VECTOR_HPP

#include <algorithm>
#include <array>
#include <cassert>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <initializer_list>

// Up to Capacity elements stored inline, ordered lexicographically like std::vector
template <typename T, std::size_t Capacity>
class FixedVector {
public:
    using const_iterator = typename std::array<T, Capacity>::const_iterator;

    static_assert(Capacity <= UINT8_MAX);

    FixedVector() : m_buffer{}, m_size{ 0 } {}

    FixedVector(std::initializer_list<T> elements) : m_buffer{}, m_size{ static_cast<std::uint8_t>(elements.size()) } {
        assert(elements.size() <= Capacity);
        std::copy(elements.begin(), elements.end(), m_buffer.begin());
    }

    const_iterator begin() const {
        return m_buffer.begin();
    }

    const_iterator end() const {
        return m_buffer.begin() + m_size;
    }

    std::size_t size() const {
        return m_size;
    }

    bool empty() const {
        return m_size == 0;
    }

    const T& front() const {
        assert(m_size > 0);
        return m_buffer[0];
    }

    const T& back() const {
        assert(m_size > 0);
        return m_buffer[m_size - 1];
    }

    const T& operator[](std::size_t index) const {
        assert(index < m_size);
        return m_buffer[index];
    }

    bool operator==(const FixedVector& rhs) const {
        return std::equal(begin(), end(), rhs.begin(), rhs.end());
    }

    auto operator<=>(const FixedVector& rhs) const {
        return std::lexicographical_compare_three_way(begin(), end(), rhs.begin(), rhs.end(), std::compare_three_way());
    }

private:
    std::array<T, Capacity> m_buffer;
    std::uint8_t m_size;
};

#endif // FIXED_VECTOR_HPP
