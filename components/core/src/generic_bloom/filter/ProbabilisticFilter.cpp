#include "ProbabilisticFilter.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "../BloomFilter.hpp"
#include "../storage/BitBloomSet.hpp"
#include "../storage/CounterTraits.hpp"
#include "../storage/CountingBloomSet.hpp"
#include "FilterConfig.hpp"

namespace generic_bloom {
namespace {
/**
 * Adapts a `BloomFilter` over `Storage` to the runtime interface.
 */
template <BloomSet Storage>
class FilterAdapter : public IProbabilisticFilter {
public:
    using filter_t = BloomFilter<Storage>;

    FilterAdapter(FilterKind kind, filter_t filter) : m_kind{kind}, m_filter{std::move(filter)} {}

    void add(std::string_view value) override { m_filter.insert(value); }

    [[nodiscard]] auto possibly_contains(std::string_view value) const -> bool override {
        return m_filter.contains(value);
    }

    void clear() override { m_filter.clear(); }

    [[nodiscard]] auto supports_removal() const -> bool override {
        return BloomSetDelete<Storage>;
    }

    void remove(std::string_view value) override {
        if constexpr (BloomSetDelete<Storage>) {
            m_filter.remove(value);
        } else {
            throw_unsupported("remove");
        }
    }

    [[nodiscard]] auto supports_counting() const -> bool override {
        return SpectralBloomSet<Storage>;
    }

    [[nodiscard]] auto estimate_count(std::string_view value) const -> uint64_t override {
        if constexpr (SpectralBloomSet<Storage>) {
            return static_cast<uint64_t>(m_filter.find_count(value));
        } else {
            throw_unsupported("estimate_count");
        }
    }

    [[nodiscard]] auto contains_more_than(std::string_view value, uint64_t count) const
            -> bool override {
        if constexpr (SpectralBloomSet<Storage>) {
            using count_t = typename Storage::count_type;
            // No counter can exceed the maximum, so larger thresholds are never met
            if (count >= static_cast<uint64_t>(CounterTraits<count_t>::max())) {
                return false;
            }
            return m_filter.contains_more_than(value, static_cast<count_t>(count));
        } else {
            throw_unsupported("contains_more_than");
        }
    }

    [[nodiscard]] auto supports_merging() const -> bool override {
        return BinaryBloomSet<Storage>;
    }

    void merge(IProbabilisticFilter const& other) override {
        if constexpr (BinaryBloomSet<Storage>) {
            m_filter.union_with(get_compatible(other).m_filter);
            SPDLOG_DEBUG("Merged {} filter.", filter_kind_to_string(m_kind));
        } else {
            throw_unsupported("merge");
        }
    }

    void intersect(IProbabilisticFilter const& other) override {
        if constexpr (BinaryBloomSet<Storage>) {
            m_filter.intersect_with(get_compatible(other).m_filter);
            SPDLOG_DEBUG("Intersected {} filter.", filter_kind_to_string(m_kind));
        } else {
            throw_unsupported("intersect");
        }
    }

    [[nodiscard]] auto get_kind() const -> FilterKind override { return m_kind; }

    [[nodiscard]] auto get_num_hashers() const -> size_t override {
        return m_filter.get_num_hashers();
    }

    [[nodiscard]] auto get_num_counters() const -> size_t override {
        return m_filter.get_num_counters();
    }

    [[nodiscard]] auto clone() const -> std::unique_ptr<IProbabilisticFilter> override {
        return std::make_unique<FilterAdapter>(*this);
    }

    [[nodiscard]] auto create_compatible() const -> std::unique_ptr<IProbabilisticFilter> override {
        return std::make_unique<FilterAdapter>(
                m_kind,
                filter_t::with_hashers(m_filter.hashers(), m_filter.get_num_counters())
        );
    }

private:
    [[noreturn]] void throw_unsupported(char const* operation) const {
        throw OperationFailed(
                ErrorCodeUnsupported,
                __FILENAME__,
                __LINE__,
                std::string{operation} + " on a " + std::string{filter_kind_to_string(m_kind)}
                        + " filter"
        );
    }

    auto get_compatible(IProbabilisticFilter const& other) const -> FilterAdapter const& {
        auto const* adapter = dynamic_cast<FilterAdapter const*>(&other);
        if (nullptr == adapter || adapter->m_kind != m_kind) {
            SPDLOG_WARN(
                    "Refusing to combine a {} filter with a {} filter.",
                    filter_kind_to_string(m_kind),
                    filter_kind_to_string(other.get_kind())
            );
            throw OperationFailed(
                    ErrorCodeBadParam,
                    __FILENAME__,
                    __LINE__,
                    "filters of different kinds can't be combined"
            );
        }
        return *adapter;
    }

    FilterKind m_kind;
    filter_t m_filter;
};

template <BloomSet Storage>
auto make_adapter(FilterConfig const& config) -> std::unique_ptr<IProbabilisticFilter> {
    return std::make_unique<FilterAdapter<Storage>>(
            config.kind,
            BloomFilter<Storage>{config.num_hashers, config.num_counters}
    );
}
}  // namespace

ProbabilisticFilter::ProbabilisticFilter(FilterConfig const& config) {
    config.validate();
    switch (config.kind) {
        case FilterKind::Binary:
            m_impl = make_adapter<BitBloomSet>(config);
            break;
        case FilterKind::Counting:
            m_impl = make_adapter<CountingBloomSet8>(config);
            break;
        case FilterKind::Spectral:
            m_impl = make_adapter<CountingBloomSet32>(config);
            break;
        default:
            throw std::logic_error("Invalid FilterKind: unreachable code path");
    }
}

ProbabilisticFilter::ProbabilisticFilter(ProbabilisticFilter const& other) {
    if (other.m_impl) {
        m_impl = other.m_impl->clone();
    }
}

auto ProbabilisticFilter::operator=(ProbabilisticFilter const& other) -> ProbabilisticFilter& {
    if (this != &other) {
        if (other.m_impl) {
            m_impl = other.m_impl->clone();
        } else {
            m_impl.reset();
        }
    }
    return *this;
}

void ProbabilisticFilter::add(std::string_view value) {
    if (m_impl) {
        m_impl->add(value);
    }
}

auto ProbabilisticFilter::possibly_contains(std::string_view value) const -> bool {
    return m_impl ? m_impl->possibly_contains(value) : false;
}

void ProbabilisticFilter::clear() {
    if (m_impl) {
        m_impl->clear();
    }
}

auto ProbabilisticFilter::supports_removal() const -> bool {
    return m_impl ? m_impl->supports_removal() : false;
}

void ProbabilisticFilter::remove(std::string_view value) {
    get_checked_impl().remove(value);
}

auto ProbabilisticFilter::supports_counting() const -> bool {
    return m_impl ? m_impl->supports_counting() : false;
}

auto ProbabilisticFilter::estimate_count(std::string_view value) const -> uint64_t {
    return get_checked_impl().estimate_count(value);
}

auto ProbabilisticFilter::contains_more_than(std::string_view value, uint64_t count) const -> bool {
    return get_checked_impl().contains_more_than(value, count);
}

auto ProbabilisticFilter::supports_merging() const -> bool {
    return m_impl ? m_impl->supports_merging() : false;
}

void ProbabilisticFilter::merge(ProbabilisticFilter const& other) {
    get_checked_impl().merge(other.get_checked_impl());
}

void ProbabilisticFilter::intersect(ProbabilisticFilter const& other) {
    get_checked_impl().intersect(other.get_checked_impl());
}

auto ProbabilisticFilter::get_kind() const -> FilterKind {
    return get_checked_impl().get_kind();
}

auto ProbabilisticFilter::get_num_hashers() const -> size_t {
    return m_impl ? m_impl->get_num_hashers() : 0;
}

auto ProbabilisticFilter::get_num_counters() const -> size_t {
    return m_impl ? m_impl->get_num_counters() : 0;
}

auto ProbabilisticFilter::create_compatible() const -> ProbabilisticFilter {
    return ProbabilisticFilter{get_checked_impl().create_compatible()};
}

auto ProbabilisticFilter::get_checked_impl() const -> IProbabilisticFilter& {
    if (nullptr == m_impl) {
        throw OperationFailed(ErrorCodeFailure, __FILENAME__, __LINE__, "filter was moved from");
    }
    return *m_impl;
}
}  // namespace generic_bloom
