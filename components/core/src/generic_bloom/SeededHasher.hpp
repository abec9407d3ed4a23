#ifndef GENERIC_BLOOM_SEEDEDHASHER_HPP
#define GENERIC_BLOOM_SEEDEDHASHER_HPP

#include <cstdint>

#include <absl/hash/hash.h>

namespace generic_bloom {
/**
 * Default hash producer for `BloomFilter`.
 *
 * Each instance mixes its own 64-bit seed into Abseil's hash of the value, so producers with
 * different seeds behave as independent hash functions. Any type hashable by `absl::Hash` (which
 * includes user types that define `AbslHashValue`) can be hashed.
 *
 * Abseil salts its hash per process, so digests are only stable within one process.
 */
class SeededHasher {
public:
    // Constructors
    /**
     * Constructs a hasher with a randomly drawn seed.
     */
    SeededHasher();

    explicit SeededHasher(uint64_t seed) : m_seed{seed} {}

    // Methods
    template <typename T>
    [[nodiscard]] auto operator()(T const& value) const -> uint64_t {
        return static_cast<uint64_t>(absl::HashOf(m_seed, value));
    }

    [[nodiscard]] auto get_seed() const -> uint64_t { return m_seed; }

    [[nodiscard]] auto operator==(SeededHasher const& other) const -> bool = default;

private:
    uint64_t m_seed;
};
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_SEEDEDHASHER_HPP
