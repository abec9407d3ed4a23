#ifndef GENERIC_BLOOM_STORAGE_COUNTINGBLOOMSET_HPP
#define GENERIC_BLOOM_STORAGE_COUNTINGBLOOMSET_HPP

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "CounterTraits.hpp"

namespace generic_bloom {
/**
 * Bloom filter storage made of saturating counters, backing counting and spectral Bloom filters.
 *
 * - `increment` adds one, saturating at `CounterTraits<Count>::max()`.
 * - `decrement` subtracts one unless the counter is zero or saturated. A saturated counter may
 *   have absorbed more increments than it can represent, so it is never decremented.
 * - `query` reports whether the counter is non-zero; `query_count` returns the raw value.
 *
 * Counter-wise union and intersection are not offered.
 *
 * @tparam Count The counter type
 */
template <Counter Count>
class CountingBloomSet {
public:
    // Types
    using count_type = Count;
    using traits_type = CounterTraits<Count>;

    // Constructors
    /**
     * @param num_counters Number of counters, all initially zero
     */
    explicit CountingBloomSet(size_t num_counters) : m_counters(num_counters, traits_type::zero()) {}

    // Methods
    [[nodiscard]] auto size() const -> size_t { return m_counters.size(); }

    void increment(size_t index) {
        assert(index < m_counters.size());
        m_counters[index] = traits_type::saturating_add(m_counters[index], traits_type::one());
    }

    void decrement(size_t index) {
        assert(index < m_counters.size());
        auto& counter = m_counters[index];
        if (counter == traits_type::zero() || counter == traits_type::max()) {
            return;
        }
        counter -= traits_type::one();
    }

    void clear() { std::fill(m_counters.begin(), m_counters.end(), traits_type::zero()); }

    [[nodiscard]] auto query(size_t index) const -> bool {
        return query_count(index) > traits_type::zero();
    }

    [[nodiscard]] auto query_count(size_t index) const -> Count const& {
        assert(index < m_counters.size());
        return m_counters[index];
    }

    [[nodiscard]] auto operator==(CountingBloomSet const& other) const -> bool = default;

private:
    std::vector<Count> m_counters;
};

using CountingBloomSet8 = CountingBloomSet<uint8_t>;
using CountingBloomSet32 = CountingBloomSet<uint32_t>;
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_STORAGE_COUNTINGBLOOMSET_HPP
