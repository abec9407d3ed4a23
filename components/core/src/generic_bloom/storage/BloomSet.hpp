#ifndef GENERIC_BLOOM_STORAGE_BLOOMSET_HPP
#define GENERIC_BLOOM_STORAGE_BLOOMSET_HPP

#include <concepts>
#include <cstddef>

namespace generic_bloom {
/**
 * Requirements for a type that can serve as the counter storage of a `BloomFilter`.
 *
 * A storage is a fixed-length sequence of counters. The filter decides which positions are
 * touched by each operation; the storage decides what a counter is and how it reacts to being
 * incremented, decremented or queried. Indices passed to any member must be less than `size()`.
 *
 * Required members:
 * - `Storage(size_t count)`: constructs `count` counters in their zero state
 * - `size()`: the number of counters
 * - `increment(index)`: records one more unit of presence at `index`
 * - `clear()`: resets every counter to its zero state
 * - `query(index)`: whether the counter at `index` indicates presence
 */
template <typename Storage>
concept BloomSet = std::constructible_from<Storage, size_t>
                   && requires(Storage& storage, Storage const& const_storage, size_t index) {
                          { const_storage.size() } -> std::convertible_to<size_t>;
                          { storage.increment(index) };
                          { storage.clear() };
                          { const_storage.query(index) } -> std::convertible_to<bool>;
                      };

/**
 * Storage that can undo an increment.
 *
 * `decrement(index)` removes one unit of presence from the counter at `index`. Only storage that
 * tracks multiplicities can offer this; a presence bit cannot tell one insertion from many.
 */
template <typename Storage>
concept BloomSetDelete = BloomSet<Storage> && requires(Storage& storage, size_t index) {
    { storage.decrement(index) };
};

/**
 * Storage whose raw counter values can be read back for multiplicity estimates.
 */
template <typename Storage>
concept SpectralBloomSet = BloomSet<Storage>
                           && std::totally_ordered<typename Storage::count_type>
                           && requires(Storage const& storage, size_t index) {
                                  {
                                      storage.query_count(index)
                                  } -> std::same_as<typename Storage::count_type const&>;
                              };

/**
 * Storage that supports in-place union and intersection with another storage of the same type
 * and size.
 */
template <typename Storage>
concept BinaryBloomSet = BloomSet<Storage> && requires(Storage& storage, Storage const& other) {
    { storage.union_with(other) };
    { storage.intersect_with(other) };
};
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_STORAGE_BLOOMSET_HPP
