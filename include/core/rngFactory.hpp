#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utils/RNG.hpp>

class RngFactory {
public:
    // "os", "openssl" or "test". A non-zero seed is only accepted by "test".
    static std::unique_ptr<utils::CSPRNG> create(const std::string& name, uint64_t seed = 0);
};
