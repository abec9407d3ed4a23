#ifndef GENERIC_BLOOM_BLOOMFILTER_HPP
#define GENERIC_BLOOM_BLOOMFILTER_HPP

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "HashIndices.hpp"
#include "SeededHasher.hpp"
#include "storage/BloomSet.hpp"
#include "TraceableException.hpp"

namespace generic_bloom {
/**
 * A Bloom filter over a pluggable counter storage.
 *
 * The filter owns an ordered set of hash producers and a storage of `n` counters. Every
 * operation maps a value to one position per producer (see `HashIndices`) and applies a
 * per-position operation of the storage. Which operations are available depends on the storage:
 * - every `BloomSet`: `insert`, `contains`, `clear`
 * - `BloomSetDelete`: `remove` (counting Bloom filter)
 * - `BinaryBloomSet`: `union_with`, `intersect_with`
 * - `SpectralBloomSet`: `contains_more_than`, `find_count` (spectral Bloom filter)
 *
 * `contains` may return false positives but never false negatives for values that were inserted
 * and not removed more often than inserted.
 *
 * Filters are not synchronized; concurrent access to one filter must be serialized by the caller.
 *
 * @tparam Storage The counter storage
 * @tparam Hasher The hash producer type
 */
template <BloomSet Storage, typename Hasher = SeededHasher>
class BloomFilter {
public:
    // Types
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(ErrorCode error_code, char const* const filename, int line_number)
                : TraceableException(error_code, filename, line_number) {}
    };

    using storage_type = Storage;
    using hasher_type = Hasher;

    // Constructors
    /**
     * Constructs a filter with `num_hashers` default-constructed hash producers.
     * @param num_hashers
     * @param num_counters
     * @throw BloomFilter::OperationFailed if `num_hashers` or `num_counters` is zero
     */
    BloomFilter(size_t num_hashers, size_t num_counters)
    requires std::default_initializable<Hasher>
            : BloomFilter(make_default_hashers(num_hashers), num_counters) {}

    /**
     * Constructs a filter that uses the given hash producers. Passing the producers of another
     * filter yields a filter that can be combined with it.
     * @param hashers
     * @param num_counters
     * @throw BloomFilter::OperationFailed if `hashers` is null or empty, or `num_counters` is
     * zero
     */
    BloomFilter(HasherSet<Hasher> hashers, size_t num_counters)
            : m_hashers{std::move(hashers)},
              m_counters(num_counters) {
        if (nullptr == m_hashers || m_hashers->empty() || 0 == num_counters) {
            throw OperationFailed(ErrorCodeBadParam, __FILENAME__, __LINE__);
        }
        SPDLOG_DEBUG(
                "Created bloom filter with {} hashers and {} counters.",
                m_hashers->size(),
                num_counters
        );
    }

    /**
     * Equivalent to `BloomFilter(std::move(hashers), num_counters)`.
     */
    [[nodiscard]] static auto with_hashers(HasherSet<Hasher> hashers, size_t num_counters)
            -> BloomFilter {
        return BloomFilter{std::move(hashers), num_counters};
    }

    // Methods
    /**
     * Increments the counters `value` maps to.
     * @param value
     */
    template <typename T>
    requires HashProducer<Hasher, T>
    void insert(T const& value) {
        for (auto const index : indices_of(value)) {
            m_counters.increment(index);
        }
    }

    /**
     * @param value
     * @return Whether `value` may have been inserted
     */
    template <typename T>
    requires HashProducer<Hasher, T>
    [[nodiscard]] auto contains(T const& value) const -> bool {
        for (auto const index : indices_of(value)) {
            if (false == m_counters.query(index)) {
                return false;
            }
        }
        return true;
    }

    /**
     * Resets every counter. The hash producers are kept.
     */
    void clear() { m_counters.clear(); }

    /**
     * Decrements the counters `value` maps to.
     *
     * Removing a value that wasn't inserted, or removing it more often than it was inserted, can
     * cause false negatives for other values that share counters with it.
     * @param value
     */
    template <typename T>
    requires HashProducer<Hasher, T> && BloomSetDelete<Storage>
    void remove(T const& value) {
        for (auto const index : indices_of(value)) {
            m_counters.decrement(index);
        }
    }

    /**
     * Adds every value of `other` to this filter.
     *
     * Both filters must use equivalent hash producers; this can't be checked in general and
     * violating it silently yields a meaningless filter.
     * @param other
     * @throw Storage::OperationFailed if the storage sizes differ
     */
    void union_with(BloomFilter const& other)
    requires BinaryBloomSet<Storage>
    {
        m_counters.union_with(other.m_counters);
    }

    /**
     * Keeps only the values of this filter that are also in `other`. The same producer
     * requirement as `union_with` applies.
     * @param other
     * @throw Storage::OperationFailed if the storage sizes differ
     */
    void intersect_with(BloomFilter const& other)
    requires BinaryBloomSet<Storage>
    {
        m_counters.intersect_with(other.m_counters);
    }

    /**
     * @param value
     * @param count
     * @return Whether every counter `value` maps to exceeds `count`, i.e., whether `value` may
     * have been inserted more than `count` times
     */
    template <typename T, typename S = Storage>
    requires HashProducer<Hasher, T> && SpectralBloomSet<S>
    [[nodiscard]] auto contains_more_than(T const& value, typename S::count_type const& count) const
            -> bool {
        for (auto const index : indices_of(value)) {
            if (m_counters.query_count(index) <= count) {
                return false;
            }
        }
        return true;
    }

    /**
     * Estimates how many times `value` was inserted as the smallest counter it maps to. The
     * estimate never undercounts, except through saturation or removals of other values.
     * @param value
     * @return The estimated multiplicity
     */
    template <typename T, typename S = Storage>
    requires HashProducer<Hasher, T> && SpectralBloomSet<S>
    [[nodiscard]] auto find_count(T const& value) const -> typename S::count_type const& {
        auto const indices = indices_of(value);
        auto it = indices.begin();
        auto const* min_count = &m_counters.query_count(*it);
        for (++it; it != indices.end(); ++it) {
            auto const& count = m_counters.query_count(*it);
            if (count < *min_count) {
                min_count = &count;
            }
        }
        return *min_count;
    }

    [[nodiscard]] auto counters() const -> Storage const& { return m_counters; }

    [[nodiscard]] auto hashers() const -> HasherSet<Hasher> const& { return m_hashers; }

    [[nodiscard]] auto get_num_hashers() const -> size_t { return m_hashers->size(); }

    [[nodiscard]] auto get_num_counters() const -> size_t { return m_counters.size(); }

    /**
     * Releases the hash producers and the storage, leaving this filter unusable.
     * @return The hash producers and the storage
     */
    [[nodiscard]] auto into_inner() && -> std::pair<HasherSet<Hasher>, Storage> {
        return {std::move(m_hashers), std::move(m_counters)};
    }

private:
    static auto make_default_hashers(size_t num_hashers) -> HasherSet<Hasher> {
        return std::make_shared<std::vector<Hasher>>(num_hashers);
    }

    template <typename T>
    [[nodiscard]] auto indices_of(T const& value) const -> HashIndices<Hasher, T> {
        return HashIndices<Hasher, T>{*m_hashers, m_counters.size(), value};
    }

    HasherSet<Hasher> m_hashers;
    Storage m_counters;
};
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_BLOOMFILTER_HPP
