#include "SeededHasher.hpp"

#include <cstdint>

#include <absl/random/random.h>

namespace generic_bloom {
namespace {
auto get_seed_generator() -> absl::BitGen& {
    thread_local absl::BitGen generator;
    return generator;
}
}  // namespace

SeededHasher::SeededHasher() : m_seed{absl::Uniform<uint64_t>(get_seed_generator())} {}
}  // namespace generic_bloom
