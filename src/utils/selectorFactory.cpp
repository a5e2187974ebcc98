#include <unordered_map>
#include <functional>
#include <memory>
#include <string>
#include <stdexcept>

#include <core/selectorFactory.hpp>

using FactoryFn = std::function<std::unique_ptr<SectionSelector>()>;

static const std::unordered_map<std::string, FactoryFn> getRegistry = {
    {"weighted", []() -> std::unique_ptr<SectionSelector> { return std::make_unique<WeightedSelector>(); }},
    {"uniform", []() -> std::unique_ptr<SectionSelector> { return std::make_unique<UniformSelector>(); }}
};

std::unique_ptr<SectionSelector> SelectorFactory::create(const std::string& name) {
    auto it = getRegistry.find(name);
    if (it == getRegistry.end()) {
        throw std::runtime_error("Unknown selector: " + name);
    }
    return it->second();
}
