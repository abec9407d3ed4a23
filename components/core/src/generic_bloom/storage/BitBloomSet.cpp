#include "BitBloomSet.hpp"

#include <algorithm>
#include <bit>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

namespace generic_bloom {
namespace {
constexpr size_t cBitsPerByte = 8;
}  // namespace

BitBloomSet::BitBloomSet(size_t num_bits)
        : m_bit_array((num_bits + cBitsPerByte - 1) / cBitsPerByte, 0),
          m_bit_array_size{num_bits} {}

void BitBloomSet::increment(size_t bit_index) {
    assert(bit_index < m_bit_array_size);
    size_t const byte_index = bit_index / cBitsPerByte;
    size_t const bit_offset = bit_index % cBitsPerByte;
    m_bit_array[byte_index] |= static_cast<uint8_t>(1U << bit_offset);
}

void BitBloomSet::clear() {
    std::fill(m_bit_array.begin(), m_bit_array.end(), 0);
}

auto BitBloomSet::query(size_t bit_index) const -> bool {
    assert(bit_index < m_bit_array_size);
    size_t const byte_index = bit_index / cBitsPerByte;
    size_t const bit_offset = bit_index % cBitsPerByte;
    return (m_bit_array[byte_index] & (1U << bit_offset)) != 0;
}

auto BitBloomSet::count_set_bits() const -> size_t {
    size_t num_set_bits{0};
    for (auto const byte : m_bit_array) {
        num_set_bits += static_cast<size_t>(std::popcount(byte));
    }
    return num_set_bits;
}

void BitBloomSet::union_with(BitBloomSet const& other) {
    check_same_size(other);
    for (size_t i = 0; i < m_bit_array.size(); ++i) {
        m_bit_array[i] |= other.m_bit_array[i];
    }
}

void BitBloomSet::intersect_with(BitBloomSet const& other) {
    check_same_size(other);
    for (size_t i = 0; i < m_bit_array.size(); ++i) {
        m_bit_array[i] &= other.m_bit_array[i];
    }
}

void BitBloomSet::check_same_size(BitBloomSet const& other) const {
    if (m_bit_array_size != other.m_bit_array_size) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "cannot combine bit sets of size " + std::to_string(m_bit_array_size) + " and "
                        + std::to_string(other.m_bit_array_size)
        );
    }
}
}  // namespace generic_bloom
