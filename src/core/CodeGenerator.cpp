#include "core/CodeGenerator.hpp"
#include "core/Errors.hpp"
#include "utils/DataConverter.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include <utility>

CodeGenerator::CodeGenerator(const GeneratorConfig& config,
    std::unique_ptr<utils::CSPRNG> rng,
    std::unique_ptr<SectionSelector> selector)
    : config_(config),
      rng_(std::move(rng)),
      selector_(std::move(selector)),
      store_(config.resolvedStatePath()),
      state_(loadOrCreate(config_, store_, resumed_)) {
    if (!rng_) throw std::invalid_argument("CodeGenerator: RNG not set");
    if (!selector_) throw std::invalid_argument("CodeGenerator: selector not set");

    LOG(INFO) << "Created generator for " << config_.hexDigits << " hex digits, "
              << state_.layout().sectionCount << " sections of " << state_.layout().sectionSize
              << " values (" << toString(state_.traversal()) << ", " << selector_->name() << ")";
}

PermutationState CodeGenerator::loadOrCreate(const GeneratorConfig& config, const StateStore& store, bool& resumed) {
    const DomainLayout layout = config.layout();

    auto loaded = store.load(layout, config.traversal);
    if (loaded) {
        resumed = true;
        VLOG(1) << "Loaded state from " << store.path() << ": " << loaded->emittedInCycle()
                << " values emitted in cycle " << loaded->completedCycles() + 1;
        return std::move(*loaded);
    }

    LOG(WARNING) << "Previous state file " << store.path() << " not found, starting a new cycle";
    resumed = false;
    return PermutationState::create(layout, config.traversal);
}

std::string CodeGenerator::generateCode(bool saveState) {
    PermutationState next = state_;
    const uint64_t value = next.nextValue(*selector_, *rng_);
    if (saveState) {
        store_.save(next);
    }
    state_ = std::move(next);

    std::string code = formatCode(value);
    LOG(INFO) << "Generated code (hex): " << code;
    return code;
}

std::vector<std::string> CodeGenerator::generateCodes(size_t quantity) {
    PermutationState next = state_;
    std::vector<std::string> codes;
    codes.reserve(quantity);
    for (size_t i = 0; i < quantity; ++i) {
        codes.push_back(formatCode(next.nextValue(*selector_, *rng_)));
    }
    store_.save(next);
    state_ = std::move(next);

    LOG(INFO) << "Generated " << quantity << " codes";
    return codes;
}

uint64_t CodeGenerator::nextValue() {
    return state_.nextValue(*selector_, *rng_);
}

void CodeGenerator::save() const {
    store_.save(state_);
}

std::string CodeGenerator::formatCode(uint64_t value) const {
    return DataConverter::UintToHex(value, config_.hexDigits, config_.uppercase);
}
