#ifndef GENERIC_BLOOM_STORAGE_COUNTERTRAITS_HPP
#define GENERIC_BLOOM_STORAGE_COUNTERTRAITS_HPP

#include <concepts>
#include <limits>

namespace generic_bloom {
/**
 * Numeric operations a counter type must provide to back a `CountingBloomSet`.
 *
 * The primary template covers every type with a `std::numeric_limits` specialization. Custom
 * counter types can specialize this template to provide `zero`, `one`, `max` and
 * `saturating_add`.
 */
template <typename Count>
struct CounterTraits {
    static_assert(
            std::numeric_limits<Count>::is_specialized,
            "CounterTraits must be specialized for non-arithmetic counter types"
    );

    static constexpr auto zero() -> Count { return Count{0}; }

    static constexpr auto one() -> Count { return Count{1}; }

    static constexpr auto max() -> Count { return std::numeric_limits<Count>::max(); }

    /**
     * @param lhs
     * @param rhs A non-negative increment
     * @return `lhs + rhs`, clamped to `max()`
     */
    static constexpr auto saturating_add(Count lhs, Count rhs) -> Count {
        if (lhs > max() - rhs) {
            return max();
        }
        return static_cast<Count>(lhs + rhs);
    }
};

/**
 * A type usable as a saturating counter.
 */
template <typename Count>
concept Counter = std::totally_ordered<Count> && std::copyable<Count> && requires(Count count) {
    { CounterTraits<Count>::zero() } -> std::convertible_to<Count>;
    { CounterTraits<Count>::one() } -> std::convertible_to<Count>;
    { CounterTraits<Count>::max() } -> std::convertible_to<Count>;
    { CounterTraits<Count>::saturating_add(count, count) } -> std::convertible_to<Count>;
    { count -= count };
};
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_STORAGE_COUNTERTRAITS_HPP
