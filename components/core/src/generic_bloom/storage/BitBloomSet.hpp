#ifndef GENERIC_BLOOM_STORAGE_BITBLOOMSET_HPP
#define GENERIC_BLOOM_STORAGE_BITBLOOMSET_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../TraceableException.hpp"

namespace generic_bloom {
/**
 * Bloom filter storage made of single presence bits.
 *
 * Incrementing a counter sets its bit; a set bit can't be cleared individually, so this storage
 * doesn't support deletion. Two bit sets of the same size can be combined with bitwise OR (union)
 * and AND (intersection).
 */
class BitBloomSet {
public:
    // Types
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(ErrorCode error_code, char const* const filename, int line_number)
                : TraceableException(error_code, filename, line_number) {}

        OperationFailed(
                ErrorCode error_code,
                char const* const filename,
                int line_number,
                std::string const& context
        )
                : TraceableException(error_code, filename, line_number, context) {}
    };

    // Constructors
    /**
     * @param num_bits Number of presence bits, all initially unset
     */
    explicit BitBloomSet(size_t num_bits);

    // Methods
    [[nodiscard]] auto size() const -> size_t { return m_bit_array_size; }

    void increment(size_t bit_index);

    void clear();

    [[nodiscard]] auto query(size_t bit_index) const -> bool;

    /**
     * @return The number of bits currently set
     */
    [[nodiscard]] auto count_set_bits() const -> size_t;

    /**
     * Sets every bit that is set in `other`.
     * @param other
     * @throw BitBloomSet::OperationFailed if `other` has a different size
     */
    void union_with(BitBloomSet const& other);

    /**
     * Keeps only the bits that are also set in `other`.
     * @param other
     * @throw BitBloomSet::OperationFailed if `other` has a different size
     */
    void intersect_with(BitBloomSet const& other);

    [[nodiscard]] auto operator==(BitBloomSet const& other) const -> bool = default;

private:
    void check_same_size(BitBloomSet const& other) const;

    std::vector<uint8_t> m_bit_array;
    size_t m_bit_array_size{0};
};
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_STORAGE_BITBLOOMSET_HPP
