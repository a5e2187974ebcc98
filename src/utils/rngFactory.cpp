#include <unordered_map>
#include <functional>
#include <memory>
#include <string>
#include <stdexcept>

#include <core/rngFactory.hpp>

using FactoryFn = std::function<std::unique_ptr<utils::CSPRNG>(uint64_t)>;

static const std::unordered_map<std::string, FactoryFn> getRegistry = {
    {"os", [](uint64_t) -> std::unique_ptr<utils::CSPRNG> { return std::make_unique<utils::OSCSPRNG>(); }},
    {"openssl", [](uint64_t) -> std::unique_ptr<utils::CSPRNG> { return std::make_unique<utils::OpenSSLCSPRNG>(); }},
    {"test", [](uint64_t seed) -> std::unique_ptr<utils::CSPRNG> {
        return seed ? std::make_unique<utils::TestCSPRNG>(seed) : std::make_unique<utils::TestCSPRNG>();
    }}
};

std::unique_ptr<utils::CSPRNG> RngFactory::create(const std::string& name, uint64_t seed) {
    auto it = getRegistry.find(name);
    if (it == getRegistry.end()) {
        throw std::runtime_error("Unknown random source: " + name);
    }
    if (seed != 0 && name != "test") {
        throw std::invalid_argument("A seed can only be given to the test random source, not " + name);
    }
    return it->second(seed);
}
