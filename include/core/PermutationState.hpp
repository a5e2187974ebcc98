#pragma once
#include <cstdint>
#include <vector>
#include <core/DomainPartitioner.hpp>
#include <utils/enums.hpp>

namespace utils { class CSPRNG; }
class SectionSelector;

// Traversal state of one domain: a cursor per section plus the set of
// sections retired from selection in the current cycle (or round).
class PermutationState {
public:
    // Fresh state: every cursor at 0, nothing retired.
    static PermutationState create(const DomainLayout& layout, TraversalMode mode = TraversalMode::Budget);

    // Rebuilds a state from persisted parts. Throws CorruptStateError when
    // the parts cannot describe a reachable state.
    PermutationState(const DomainLayout& layout,
        TraversalMode mode,
        uint64_t completedCycles,
        std::vector<uint64_t> cursors,
        std::vector<bool> retired);

    // Picks an eligible section, returns its next value and advances it.
    // Throws ExhaustedSelectionError if the selector yields nothing usable;
    // the state is left untouched in that case.
    uint64_t nextValue(SectionSelector& selector, utils::CSPRNG& rng);

    bool isEligible(uint64_t section) const;
    uint64_t eligibleCount() const;
    // Values left to `section` before it retires; 0 when retired.
    uint64_t remaining(uint64_t section) const;
    uint64_t peekValue(uint64_t section) const;
    // Values emitted since the current full cycle started.
    uint64_t emittedInCycle() const;

    const DomainLayout& layout() const { return layout_; }
    TraversalMode traversal() const { return mode_; }
    uint64_t completedCycles() const { return cycles_; }
    const std::vector<uint64_t>& cursors() const { return cursors_; }
    const std::vector<bool>& retired() const { return retired_; }

    bool operator==(const PermutationState& other) const = default;

private:
    void validate() const;
    void advance(uint64_t section);

    DomainLayout layout_;
    TraversalMode mode_;
    uint64_t cycles_;
    std::vector<uint64_t> cursors_;
    std::vector<bool> retired_;
    uint64_t retiredCount_ = 0;
};
