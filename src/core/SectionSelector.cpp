#include "core/SectionSelector.hpp"

std::optional<uint64_t> WeightedSelector::select(const PermutationState& state, utils::CSPRNG& rng) {
    const uint64_t M = state.layout().sectionCount;

    uint64_t total = 0;
    for (uint64_t i = 0; i < M; ++i) {
        total += state.remaining(i);
    }
    if (total == 0) {
        return std::nullopt;
    }

    uint64_t r = rng.randomBelow(total);
    for (uint64_t i = 0; i < M; ++i) {
        const uint64_t w = state.remaining(i);
        if (r < w) return i;
        r -= w;
    }
    return std::nullopt;
}

std::optional<uint64_t> UniformSelector::select(const PermutationState& state, utils::CSPRNG& rng) {
    const uint64_t eligible = state.eligibleCount();
    if (eligible == 0) {
        return std::nullopt;
    }

    uint64_t r = rng.randomBelow(eligible);
    for (uint64_t i = 0; i < state.layout().sectionCount; ++i) {
        if (!state.isEligible(i)) continue;
        if (r == 0) return i;
        --r;
    }
    return std::nullopt;
}
