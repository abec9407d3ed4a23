#include "FilterConfig.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace generic_bloom {
namespace {
std::string to_lower(std::string_view input) {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}
}  // namespace

auto parse_filter_kind(std::string_view kind_str) -> std::optional<FilterKind> {
    auto lowered = to_lower(kind_str);
    if (lowered == "binary" || lowered == "bit") {
        return FilterKind::Binary;
    }
    if (lowered == "counting") {
        return FilterKind::Counting;
    }
    if (lowered == "spectral") {
        return FilterKind::Spectral;
    }
    return std::nullopt;
}

auto filter_kind_to_string(FilterKind kind) -> std::string_view {
    switch (kind) {
        case FilterKind::Binary:
            return "binary";
        case FilterKind::Counting:
            return "counting";
        case FilterKind::Spectral:
            return "spectral";
    }
    return "unknown";
}

void FilterConfig::validate() const {
    if (0 == num_hashers) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "a filter needs at least one hasher"
        );
    }
    if (0 == num_counters) {
        throw OperationFailed(
                ErrorCodeBadParam,
                __FILENAME__,
                __LINE__,
                "a filter needs at least one counter"
        );
    }
}
}  // namespace generic_bloom
