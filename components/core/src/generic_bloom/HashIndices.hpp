#ifndef GENERIC_BLOOM_HASHINDICES_HPP
#define GENERIC_BLOOM_HASHINDICES_HPP

#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <vector>

namespace generic_bloom {
/**
 * A type that can hash values of type `T` to a 64-bit digest. The digest must be a pure function
 * of the producer's state and the value.
 */
template <typename Hasher, typename T>
concept HashProducer = std::copy_constructible<Hasher> && requires(Hasher const& hasher, T const& value) {
    { hasher(value) } -> std::convertible_to<uint64_t>;
};

/**
 * Ordered, immutable set of hash producers, shared between filters that must agree on where
 * each value lands.
 */
template <typename Hasher>
using HasherSet = std::shared_ptr<std::vector<Hasher> const>;

/**
 * Lazy sequence of the storage positions a value maps to: one position per hash producer, equal
 * to the producer's digest modulo the storage size.
 *
 * Positions are not de-duplicated; if two producers map a value to the same position, that
 * position appears twice. The sequence may be iterated any number of times. The sequence and its
 * iterators refer to the producers and the value without owning them, so neither may be destroyed
 * while they're in use. Iterators stay valid after the sequence itself is destroyed.
 */
template <typename Hasher, typename T>
requires HashProducer<Hasher, T>
class HashIndices {
public:
    class Iterator {
    public:
        // Types
        using iterator_category = std::forward_iterator_tag;
        using value_type = size_t;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = size_t;

        // Constructors
        Iterator() = default;

        Iterator(
                typename std::vector<Hasher>::const_iterator it,
                uint64_t num_counters,
                T const* value
        )
                : m_it{it},
                  m_num_counters{num_counters},
                  m_value{value} {}

        // Methods
        auto operator*() const -> size_t {
            return static_cast<size_t>(static_cast<uint64_t>((*m_it)(*m_value)) % m_num_counters);
        }

        auto operator++() -> Iterator& {
            ++m_it;
            return *this;
        }

        auto operator++(int) -> Iterator {
            auto previous = *this;
            ++m_it;
            return previous;
        }

        auto operator==(Iterator const& other) const -> bool { return m_it == other.m_it; }

    private:
        typename std::vector<Hasher>::const_iterator m_it;
        uint64_t m_num_counters{1};
        T const* m_value{nullptr};
    };

    // Constructors
    /**
     * @param hashers
     * @param num_counters Storage size; must be greater than zero
     * @param value
     */
    HashIndices(std::vector<Hasher> const& hashers, size_t num_counters, T const& value)
            : m_hashers{&hashers},
              m_num_counters{static_cast<uint64_t>(num_counters)},
              m_value{&value} {
        assert(num_counters > 0);
    }

    // Methods
    [[nodiscard]] auto begin() const -> Iterator {
        return Iterator{m_hashers->cbegin(), m_num_counters, m_value};
    }

    [[nodiscard]] auto end() const -> Iterator {
        return Iterator{m_hashers->cend(), m_num_counters, m_value};
    }

    [[nodiscard]] auto size() const -> size_t { return m_hashers->size(); }

private:
    std::vector<Hasher> const* m_hashers;
    uint64_t m_num_counters;
    T const* m_value;
};

/**
 * Materializes the positions `value` maps to.
 * @param hashers
 * @param num_counters Storage size; must be greater than zero
 * @param value
 * @return One position per hash producer, in producer order
 */
template <typename Hasher, typename T>
requires HashProducer<Hasher, T>
auto compute_hash_indices(std::vector<Hasher> const& hashers, size_t num_counters, T const& value)
        -> std::vector<size_t> {
    HashIndices<Hasher, T> const indices{hashers, num_counters, value};
    return {indices.begin(), indices.end()};
}
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_HASHINDICES_HPP
