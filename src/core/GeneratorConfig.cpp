#include "core/GeneratorConfig.hpp"
#include <algorithm>

DomainLayout GeneratorConfig::layout() const {
    const uint64_t domain = DomainPartitioner::domainForHexDigits(hexDigits);
    if (sectionSize != 0) {
        return DomainPartitioner::partition(domain, sectionSize);
    }
    if (sectionCount == 0) {
        return DomainPartitioner::partitionBySections(domain, std::min(defaultSectionCount, domain));
    }
    return DomainPartitioner::partitionBySections(domain, sectionCount);
}

std::string GeneratorConfig::defaultStatePath() const {
    return "dig_" + std::to_string(hexDigits) + "-div_" + std::to_string(layout().sectionCount) + ".state";
}

std::string GeneratorConfig::resolvedStatePath() const {
    return statePath.empty() ? defaultStatePath() : statePath;
}
