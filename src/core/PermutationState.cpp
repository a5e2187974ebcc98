#include "core/PermutationState.hpp"
#include "core/Errors.hpp"
#include "core/SectionSelector.hpp"
#include <glog/logging.h>
#include <string>
#include <utility>

PermutationState PermutationState::create(const DomainLayout& layout, TraversalMode mode) {
    return PermutationState(layout, mode, 0,
        std::vector<uint64_t>(layout.sectionCount, 0),
        std::vector<bool>(layout.sectionCount, false));
}

PermutationState::PermutationState(const DomainLayout& layout,
    TraversalMode mode,
    uint64_t completedCycles,
    std::vector<uint64_t> cursors,
    std::vector<bool> retired)
    : layout_(layout), mode_(mode), cycles_(completedCycles),
      cursors_(std::move(cursors)), retired_(std::move(retired)) {
    for (bool r : retired_) {
        if (r) ++retiredCount_;
    }
    validate();
}

void PermutationState::validate() const {
    const uint64_t S = layout_.sectionSize;
    const uint64_t M = layout_.sectionCount;

    if (S == 0 || M == 0 || layout_.domainSize % S != 0 || layout_.domainSize / S != M) {
        throw CorruptStateError("Section layout does not match the domain: N=" + std::to_string(layout_.domainSize) +
            " S=" + std::to_string(S) + " M=" + std::to_string(M));
    }
    if (mode_ != TraversalMode::Budget && mode_ != TraversalMode::Rounds) {
        throw CorruptStateError("Unknown traversal mode " + std::to_string(static_cast<int>(mode_)));
    }
    if (cursors_.size() != M || retired_.size() != M) {
        throw CorruptStateError("Expected " + std::to_string(M) + " sections, got " +
            std::to_string(cursors_.size()) + " cursors and " + std::to_string(retired_.size()) + " flags");
    }
    if (retiredCount_ == M) {
        throw CorruptStateError("Every section is retired; the cycle was never reset");
    }

    for (uint64_t i = 0; i < M; ++i) {
        if (cursors_[i] >= S) {
            throw CorruptStateError("Cursor of section " + std::to_string(i) + " is " +
                std::to_string(cursors_[i]) + ", outside [0, " + std::to_string(S) + ")");
        }
    }

    if (mode_ == TraversalMode::Budget) {
        for (uint64_t i = 0; i < M; ++i) {
            if (retired_[i] && cursors_[i] != 0) {
                throw CorruptStateError("Section " + std::to_string(i) + " is retired with cursor " +
                    std::to_string(cursors_[i]));
            }
        }
        return;
    }

    // rounds: eligible sections share cursor c, retired ones are one step ahead
    uint64_t first = 0;
    while (retired_[first]) ++first;
    const uint64_t c = cursors_[first];
    const uint64_t ahead = (c + 1) % S;
    for (uint64_t i = 0; i < M; ++i) {
        const uint64_t expected = retired_[i] ? ahead : c;
        if (cursors_[i] != expected) {
            throw CorruptStateError("Section " + std::to_string(i) + " has cursor " +
                std::to_string(cursors_[i]) + " but the current round expects " + std::to_string(expected));
        }
    }
}

bool PermutationState::isEligible(uint64_t section) const {
    return section < layout_.sectionCount && !retired_[section];
}

uint64_t PermutationState::eligibleCount() const {
    return layout_.sectionCount - retiredCount_;
}

uint64_t PermutationState::remaining(uint64_t section) const {
    if (!isEligible(section)) return 0;
    return layout_.sectionSize - cursors_[section];
}

uint64_t PermutationState::peekValue(uint64_t section) const {
    return layout_.valueAt(section, cursors_.at(section));
}

uint64_t PermutationState::emittedInCycle() const {
    if (mode_ == TraversalMode::Budget) {
        uint64_t sum = retiredCount_ * layout_.sectionSize;
        for (uint64_t c : cursors_) sum += c;
        return sum;
    }
    uint64_t first = 0;
    while (retired_[first]) ++first;
    return cursors_[first] * layout_.sectionCount + retiredCount_;
}

uint64_t PermutationState::nextValue(SectionSelector& selector, utils::CSPRNG& rng) {
    auto picked = selector.select(*this, rng);
    if (!picked) {
        throw ExhaustedSelectionError("Selector '" + selector.name() + "' found no eligible section after " +
            std::to_string(emittedInCycle()) + " of " + std::to_string(layout_.domainSize) + " values");
    }
    const uint64_t section = *picked;
    if (!isEligible(section)) {
        throw ExhaustedSelectionError("Selector '" + selector.name() + "' picked section " +
            std::to_string(section) + " which is not eligible");
    }

    const uint64_t value = peekValue(section);
    VLOG(1) << "Section " << section << " [" << layout_.bandMin(section) << ", "
            << layout_.bandMax(section) << "] emits " << value;
    advance(section);
    return value;
}

void PermutationState::advance(uint64_t section) {
    uint64_t& cursor = cursors_[section];
    cursor = (cursor + 1) % layout_.sectionSize;
    VLOG(1) << "New cursor of section " << section << ": " << cursor;

    const bool retire = mode_ == TraversalMode::Rounds || cursor == 0;
    if (retire) {
        retired_[section] = true;
        ++retiredCount_;
    }

    if (retiredCount_ == layout_.sectionCount) {
        retired_.assign(layout_.sectionCount, false);
        retiredCount_ = 0;
        if (cursors_[0] == 0) {
            ++cycles_;
            VLOG(1) << "Full cycle " << cycles_ << " complete, every section restarts at its offset";
        } else {
            VLOG(1) << "Round complete, every section is eligible again";
        }
    }
}
