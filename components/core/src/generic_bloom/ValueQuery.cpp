#include "ValueQuery.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <nlohmann/json.hpp>

#include "ErrorCode.hpp"
#include "filter/FilterConfig.hpp"
#include "filter/ProbabilisticFilter.hpp"

namespace generic_bloom {
auto try_read_values(std::string const& path, std::vector<std::string>& values) -> ErrorCode {
    std::ifstream in(path);
    if (false == in.is_open()) {
        return ErrorCodeFileNotFound;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (false == line.empty() && '\r' == line.back()) {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        values.emplace_back(std::move(line));
    }
    if (in.bad()) {
        return ErrorCodeFailure;
    }
    return ErrorCodeSuccess;
}

auto get_distinct_values(std::vector<std::string> const& values) -> std::vector<std::string> {
    absl::flat_hash_set<std::string> seen;
    std::vector<std::string> distinct_values;
    for (auto const& value : values) {
        if (seen.insert(value).second) {
            distinct_values.emplace_back(value);
        }
    }
    return distinct_values;
}

auto query_values(
        ProbabilisticFilter const& filter,
        std::vector<std::string> const& values,
        std::optional<uint64_t> threshold
) -> nlohmann::json {
    nlohmann::json results = nlohmann::json::array();
    for (auto const& value : values) {
        nlohmann::json result{{"value", value}, {"contains", filter.possibly_contains(value)}};
        if (filter.supports_counting()) {
            result["count"] = filter.estimate_count(value);
            if (threshold.has_value()) {
                result["more_than_threshold"] = filter.contains_more_than(value, threshold.value());
            }
        }
        results.emplace_back(std::move(result));
    }
    return results;
}

auto make_query_report(
        ProbabilisticFilter const& filter,
        size_t num_inserted,
        size_t num_removed,
        nlohmann::json results
) -> nlohmann::json {
    return nlohmann::json{
            {"kind", std::string{filter_kind_to_string(filter.get_kind())}},
            {"num_hashers", filter.get_num_hashers()},
            {"num_counters", filter.get_num_counters()},
            {"num_inserted", num_inserted},
            {"num_removed", num_removed},
            {"results", std::move(results)}
    };
}
}  // namespace generic_bloom
