#pragma once
#include <cstdint>
#include <string>
#include <core/DomainPartitioner.hpp>
#include <utils/enums.hpp>

struct GeneratorConfig {
    static constexpr uint64_t defaultSectionCount = 1024;

    unsigned hexDigits = 8;
    // Zero means defaultSectionCount sections, or one per value when the
    // domain is smaller than that.
    uint64_t sectionCount = 0;
    // Takes precedence over sectionCount when non-zero.
    uint64_t sectionSize = 0;
    TraversalMode traversal = TraversalMode::Budget;
    // Empty means defaultStatePath().
    std::string statePath;
    bool uppercase = false;

    // Throws ConfigurationError for an invalid combination.
    DomainLayout layout() const;

    // dig_<digits>-div_<sections>.state
    std::string defaultStatePath() const;
    std::string resolvedStatePath() const;
};
