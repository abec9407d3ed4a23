#ifndef GENERIC_BLOOM_VALUEQUERY_HPP
#define GENERIC_BLOOM_VALUEQUERY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ErrorCode.hpp"
#include "filter/ProbabilisticFilter.hpp"

namespace generic_bloom {
/**
 * Reads newline-separated values from a file. Empty lines are skipped and a trailing '\r' is
 * stripped from each line.
 * @param path
 * @param values Returns the values in file order, appended to any existing values
 * @return ErrorCodeSuccess on success
 * @return ErrorCodeFileNotFound if the file couldn't be opened
 * @return ErrorCodeFailure if reading failed partway
 */
[[nodiscard]] auto try_read_values(std::string const& path, std::vector<std::string>& values)
        -> ErrorCode;

/**
 * @param values
 * @return The distinct values in first-seen order
 */
[[nodiscard]] auto get_distinct_values(std::vector<std::string> const& values)
        -> std::vector<std::string>;

/**
 * Queries `filter` for each value.
 *
 * Each result has `value` and `contains`. Filters that track counts add `count`, and also
 * `more_than_threshold` when a threshold is given.
 * @param filter
 * @param values
 * @param threshold
 * @return A JSON array with one result per value, in order
 */
[[nodiscard]] auto query_values(
        ProbabilisticFilter const& filter,
        std::vector<std::string> const& values,
        std::optional<uint64_t> threshold
) -> nlohmann::json;

/**
 * @param filter
 * @param num_inserted
 * @param num_removed
 * @param results As returned by `query_values`
 * @return The query report: the filter's shape, the number of values inserted and removed, and
 * the results
 */
[[nodiscard]] auto make_query_report(
        ProbabilisticFilter const& filter,
        size_t num_inserted,
        size_t num_removed,
        nlohmann::json results
) -> nlohmann::json;
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_VALUEQUERY_HPP
