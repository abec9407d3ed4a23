#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "filter/FilterConfig.hpp"
#include "filter/ProbabilisticFilter.hpp"
#include "ErrorCode.hpp"
#include "TraceableException.hpp"
#include "ValueQuery.hpp"

using generic_bloom::FilterConfig;
using generic_bloom::ProbabilisticFilter;

namespace {
struct QueryOptions {
    FilterConfig config;
    std::string insert_path;
    std::string remove_path;
    std::string queries_path;
    std::optional<uint64_t> threshold;
    std::string output_json_path;
};

/**
 * Reads values from `path`, logging the reason on failure.
 * @param path
 * @param values
 * @return Whether the values were read
 */
auto read_values(std::string const& path, std::vector<std::string>& values) -> bool {
    auto const error_code = generic_bloom::try_read_values(path, values);
    if (generic_bloom::ErrorCodeSuccess != error_code) {
        SPDLOG_ERROR(
                "Failed to read values from {}: {}.",
                path,
                generic_bloom::get_error_code_description(error_code)
        );
        return false;
    }
    return true;
}

auto emit_json(nlohmann::json const& output, std::string const& output_path) -> bool {
    if (output_path.empty()) {
        std::cout << output.dump(2) << std::endl;
        return true;
    }

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (false == out.is_open()) {
        SPDLOG_ERROR("Failed to open output file {}.", output_path);
        return false;
    }
    out << output.dump(2) << '\n';
    if (false == out.good()) {
        SPDLOG_ERROR("Failed to write output file {}.", output_path);
        return false;
    }
    return true;
}

auto run_query(QueryOptions const& options) -> int {
    ProbabilisticFilter filter{options.config};

    std::vector<std::string> inserted_values;
    if (false == read_values(options.insert_path, inserted_values)) {
        return 1;
    }
    for (auto const& value : inserted_values) {
        filter.add(value);
    }

    std::vector<std::string> removed_values;
    if (false == options.remove_path.empty()) {
        if (false == filter.supports_removal()) {
            SPDLOG_ERROR(
                    "A {} filter doesn't support removal.",
                    generic_bloom::filter_kind_to_string(filter.get_kind())
            );
            return 1;
        }
        if (false == read_values(options.remove_path, removed_values)) {
            return 1;
        }
        for (auto const& value : removed_values) {
            filter.remove(value);
        }
    }

    std::vector<std::string> query_values;
    if (options.queries_path.empty()) {
        query_values = generic_bloom::get_distinct_values(inserted_values);
    } else if (false == read_values(options.queries_path, query_values)) {
        return 1;
    }

    if (options.threshold.has_value() && false == filter.supports_counting()) {
        SPDLOG_WARN(
                "Ignoring threshold since a {} filter doesn't track counts.",
                generic_bloom::filter_kind_to_string(filter.get_kind())
        );
    }

    auto const output = generic_bloom::make_query_report(
            filter,
            inserted_values.size(),
            removed_values.size(),
            generic_bloom::query_values(filter, query_values, options.threshold)
    );
    return emit_json(output, options.output_json_path) ? 0 : 1;
}
}  // namespace

int main(int argc, char const* argv[]) {
    try {
        auto stderr_logger = spdlog::stderr_logger_st("stderr");
        spdlog::set_default_logger(stderr_logger);
        spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%l] %v");
    } catch (std::exception const&) {
        return 1;
    }

    try {
        namespace po = boost::program_options;

        auto print_usage = []() {
            std::cerr << "Usage: generic-bloom <command> [options]\n"
                         "Commands:\n"
                         "  query  Build a filter from a file of values and query it\n"
                      << std::endl;
        };

        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string command = argv[1];
        if (command == "--help" || command == "-h") {
            print_usage();
            return 0;
        }

        if (command == "query") {
            QueryOptions options;
            std::string kind_str{"binary"};
            uint64_t threshold{0};

            po::options_description options_description("Query options");
            // clang-format off
            options_description.add_options()
                    ("help,h", "Show help")
                    ("kind", po::value<std::string>(&kind_str)->value_name("KIND")
                             ->default_value(kind_str),
                     "Filter kind: binary, counting or spectral")
                    ("hashers", po::value<size_t>(&options.config.num_hashers)
                             ->value_name("N")->default_value(7),
                     "Number of hash functions")
                    ("counters", po::value<size_t>(&options.config.num_counters)
                             ->value_name("M")->default_value(1024),
                     "Number of counters")
                    ("insert", po::value<std::string>(&options.insert_path)->value_name("PATH"),
                     "File of values to insert, one per line")
                    ("remove", po::value<std::string>(&options.remove_path)->value_name("PATH"),
                     "File of values to remove, one per line (counting/spectral only)")
                    ("queries", po::value<std::string>(&options.queries_path)->value_name("PATH"),
                     "File of values to query; defaults to the inserted values")
                    ("threshold", po::value<uint64_t>(&threshold)->value_name("T"),
                     "Also report whether each value was inserted more than T times")
                    ("output-json", po::value<std::string>(&options.output_json_path)
                             ->value_name("PATH"),
                     "Write JSON output to file instead of stdout");
            // clang-format on

            po::positional_options_description positional;
            positional.add("insert", 1);

            int sub_argc = argc - 1;
            char const** sub_argv = argv + 1;
            po::variables_map vm;
            po::store(
                    po::command_line_parser(sub_argc, sub_argv)
                            .options(options_description)
                            .positional(positional)
                            .run(),
                    vm
            );
            po::notify(vm);

            if (vm.count("help")) {
                std::cerr << "Usage: generic-bloom query --insert <PATH> [--kind <KIND>]"
                             " [--hashers <N>] [--counters <M>] [--remove <PATH>]"
                             " [--queries <PATH>] [--threshold <T>] [--output-json <PATH>]"
                          << std::endl
                          << std::endl;
                std::cerr << options_description << std::endl;
                return 0;
            }

            if (options.insert_path.empty()) {
                throw std::invalid_argument("insert must be specified.");
            }
            auto const kind = generic_bloom::parse_filter_kind(kind_str);
            if (false == kind.has_value()) {
                throw std::invalid_argument("Unknown filter kind: " + kind_str);
            }
            options.config.kind = kind.value();
            if (vm.count("threshold")) {
                options.threshold = threshold;
            }

            return run_query(options);
        }

        print_usage();
        return 1;
    } catch (generic_bloom::TraceableException const& e) {
        SPDLOG_ERROR("{}", e.what());
        return 1;
    } catch (std::exception const& e) {
        SPDLOG_ERROR("{}", e.what());
        std::cerr << "Try --help for usage." << std::endl;
        return 1;
    }
}
