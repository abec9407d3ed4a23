#ifndef GENERIC_BLOOM_FILTER_FILTERCONFIG_HPP
#define GENERIC_BLOOM_FILTER_FILTERCONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../TraceableException.hpp"

namespace generic_bloom {
/**
 * Storage variants selectable at runtime.
 */
enum class FilterKind : uint8_t {
    Binary = 0,
    Counting = 1,
    Spectral = 2,
};

/**
 * Parses a filter kind name (case-insensitive).
 * @param kind_str One of "binary" (or "bit"), "counting", "spectral"
 * @return The kind, or std::nullopt if the name is unknown
 */
auto parse_filter_kind(std::string_view kind_str) -> std::optional<FilterKind>;

auto filter_kind_to_string(FilterKind kind) -> std::string_view;

struct FilterConfig {
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(
                ErrorCode error_code,
                char const* const filename,
                int line_number,
                std::string const& context
        )
                : TraceableException(error_code, filename, line_number, context) {}
    };

    /**
     * @throw FilterConfig::OperationFailed if there are no hashers or no counters
     */
    void validate() const;

    FilterKind kind{FilterKind::Binary};
    size_t num_hashers{0};
    size_t num_counters{0};
};
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_FILTER_FILTERCONFIG_HPP
