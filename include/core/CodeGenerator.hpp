#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <core/GeneratorConfig.hpp>
#include <core/PermutationState.hpp>
#include <core/SectionSelector.hpp>
#include <core/StateStore.hpp>
#include <utils/RNG.hpp>

// One load / pick / persist transaction per code. Loads the state file named
// by the config, or starts a fresh state when there is none.
class CodeGenerator {
public:
    CodeGenerator(const GeneratorConfig& config,
        std::unique_ptr<utils::CSPRNG> rng,
        std::unique_ptr<SectionSelector> selector);

    // Persists after the value is picked unless saveState is false. On any
    // error neither the state file nor the in-memory state change.
    std::string generateCode(bool saveState = true);

    // Generates `quantity` codes and persists once at the end.
    std::vector<std::string> generateCodes(size_t quantity);

    // Advances the in-memory state only.
    uint64_t nextValue();
    void save() const;

    std::string formatCode(uint64_t value) const;

    const PermutationState& state() const { return state_; }
    const StateStore& store() const { return store_; }
    // True when the state came from an existing file.
    bool resumed() const { return resumed_; }

private:
    static PermutationState loadOrCreate(const GeneratorConfig& config, const StateStore& store, bool& resumed);

    GeneratorConfig config_;
    std::unique_ptr<utils::CSPRNG> rng_;
    std::unique_ptr<SectionSelector> selector_;
    StateStore store_;
    bool resumed_ = false;
    PermutationState state_;
};
