#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <core/PermutationState.hpp>
#include <utils/RNG.hpp>

// Chooses which eligible section emits the next value.
class SectionSelector {
public:
    virtual ~SectionSelector() = default;

    // Index of an eligible section, or nothing if none can be found.
    virtual std::optional<uint64_t> select(const PermutationState& state, utils::CSPRNG& rng) = 0;

    virtual std::string name() const = 0;
};

// Weight = values the section has left, so every value not yet emitted in
// the cycle is equally likely to come next.
class WeightedSelector : public SectionSelector {
public:
    std::optional<uint64_t> select(const PermutationState& state, utils::CSPRNG& rng) override;
    std::string name() const override { return "weighted"; }
};

class UniformSelector : public SectionSelector {
public:
    std::optional<uint64_t> select(const PermutationState& state, utils::CSPRNG& rng) override;
    std::string name() const override { return "uniform"; }
};
