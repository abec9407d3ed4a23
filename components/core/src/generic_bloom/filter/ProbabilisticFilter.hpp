#ifndef GENERIC_BLOOM_FILTER_PROBABILISTICFILTER_HPP
#define GENERIC_BLOOM_FILTER_PROBABILISTICFILTER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "../TraceableException.hpp"
#include "FilterConfig.hpp"

namespace generic_bloom {
/**
 * Abstract interface for Bloom filters over string values whose storage is chosen at runtime.
 *
 * Operations the underlying storage can't perform throw `OperationFailed` with
 * `ErrorCodeUnsupported`; use the `supports_*` methods to check beforehand.
 */
class IProbabilisticFilter {
public:
    // Types
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

    virtual ~IProbabilisticFilter() = default;

    virtual void add(std::string_view value) = 0;
    [[nodiscard]] virtual auto possibly_contains(std::string_view value) const -> bool = 0;
    virtual void clear() = 0;

    [[nodiscard]] virtual auto supports_removal() const -> bool = 0;
    virtual void remove(std::string_view value) = 0;

    [[nodiscard]] virtual auto supports_counting() const -> bool = 0;
    [[nodiscard]] virtual auto estimate_count(std::string_view value) const -> uint64_t = 0;
    [[nodiscard]] virtual auto contains_more_than(std::string_view value, uint64_t count) const
            -> bool = 0;

    [[nodiscard]] virtual auto supports_merging() const -> bool = 0;
    /**
     * Unions `other` into this filter. `other` must have been created by `create_compatible` on
     * this filter (or vice versa).
     */
    virtual void merge(IProbabilisticFilter const& other) = 0;
    virtual void intersect(IProbabilisticFilter const& other) = 0;

    [[nodiscard]] virtual auto get_kind() const -> FilterKind = 0;
    [[nodiscard]] virtual auto get_num_hashers() const -> size_t = 0;
    [[nodiscard]] virtual auto get_num_counters() const -> size_t = 0;

    /**
     * Create a deep copy of this filter
     */
    [[nodiscard]] virtual auto clone() const -> std::unique_ptr<IProbabilisticFilter> = 0;

    /**
     * Creates an empty filter of the same kind and size sharing this filter's hashers
     */
    [[nodiscard]] virtual auto create_compatible() const
            -> std::unique_ptr<IProbabilisticFilter> = 0;

protected:
    IProbabilisticFilter() = default;
    IProbabilisticFilter(IProbabilisticFilter const&) = default;
    auto operator=(IProbabilisticFilter const&) -> IProbabilisticFilter& = default;
    IProbabilisticFilter(IProbabilisticFilter&&) = default;
    auto operator=(IProbabilisticFilter&&) -> IProbabilisticFilter& = default;
};

/**
 * Concrete wrapper for probabilistic filters with value semantics.
 *
 * A moved-from filter holds no implementation. Adding to or clearing it does nothing, queries
 * report an empty filter, and operations without a meaningful empty result throw
 * `OperationFailed` with `ErrorCodeFailure`.
 */
class ProbabilisticFilter {
public:
    // Types
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

    // Constructors
    /**
     * Constructs an empty filter as described by `config`.
     * @throw FilterConfig::OperationFailed if `config` is invalid
     */
    explicit ProbabilisticFilter(FilterConfig const& config);

    /**
     * Copy constructor (deep copy)
     */
    ProbabilisticFilter(ProbabilisticFilter const& other);

    /**
     * Copy assignment (deep copy)
     */
    auto operator=(ProbabilisticFilter const& other) -> ProbabilisticFilter&;

    ProbabilisticFilter(ProbabilisticFilter&& other) noexcept = default;
    auto operator=(ProbabilisticFilter&& other) noexcept -> ProbabilisticFilter& = default;

    ~ProbabilisticFilter() = default;

    // Methods
    void add(std::string_view value);

    [[nodiscard]] auto possibly_contains(std::string_view value) const -> bool;

    void clear();

    [[nodiscard]] auto supports_removal() const -> bool;

    void remove(std::string_view value);

    [[nodiscard]] auto supports_counting() const -> bool;

    [[nodiscard]] auto estimate_count(std::string_view value) const -> uint64_t;

    [[nodiscard]] auto contains_more_than(std::string_view value, uint64_t count) const -> bool;

    [[nodiscard]] auto supports_merging() const -> bool;

    void merge(ProbabilisticFilter const& other);

    void intersect(ProbabilisticFilter const& other);

    [[nodiscard]] auto get_kind() const -> FilterKind;

    [[nodiscard]] auto get_num_hashers() const -> size_t;

    [[nodiscard]] auto get_num_counters() const -> size_t;

    /**
     * @return An empty filter that can be merged or intersected with this one
     */
    [[nodiscard]] auto create_compatible() const -> ProbabilisticFilter;

    /**
     * @return Whether this filter holds an implementation, i.e., wasn't moved from
     */
    [[nodiscard]] auto is_valid() const -> bool { return nullptr != m_impl; }

private:
    explicit ProbabilisticFilter(std::unique_ptr<IProbabilisticFilter> impl)
            : m_impl{std::move(impl)} {}

    [[nodiscard]] auto get_checked_impl() const -> IProbabilisticFilter&;

    std::unique_ptr<IProbabilisticFilter> m_impl;
};
}  // namespace generic_bloom

#endif  // GENERIC_BLOOM_FILTER_PROBABILISTICFILTER_HPP
