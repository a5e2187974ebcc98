#include "core/DomainPartitioner.hpp"
#include "core/Errors.hpp"
#include <string>

uint64_t DomainLayout::startOffset(uint64_t section) const {
    return section * sectionSize + (section % sectionCount);
}

uint64_t DomainLayout::valueAt(uint64_t section, uint64_t cursor) const {
    uint64_t start = startOffset(section) % sectionSize;
    return bandMin(section) + (start + cursor % sectionSize) % sectionSize;
}

uint64_t DomainPartitioner::domainForHexDigits(unsigned digits) {
    if (digits < 1 || digits > 15) {
        throw ConfigurationError("Code width must be between 1 and 15 hex digits. Got: " + std::to_string(digits));
    }
    return uint64_t{1} << (4 * digits);
}

DomainLayout DomainPartitioner::partition(uint64_t domainSize, uint64_t sectionSize) {
    if (domainSize == 0) {
        throw ConfigurationError("Domain size must be greater than zero");
    }
    if (sectionSize == 0) {
        throw ConfigurationError("Section size must be greater than zero");
    }
    if (domainSize % sectionSize != 0) {
        throw ConfigurationError("Section size " + std::to_string(sectionSize) +
            " does not divide domain size " + std::to_string(domainSize));
    }

    DomainLayout layout;
    layout.domainSize = domainSize;
    layout.sectionSize = sectionSize;
    layout.sectionCount = domainSize / sectionSize;
    return layout;
}

DomainLayout DomainPartitioner::partitionBySections(uint64_t domainSize, uint64_t sectionCount) {
    if (sectionCount == 0) {
        throw ConfigurationError("Section count must be greater than zero");
    }
    if (domainSize % sectionCount != 0) {
        throw ConfigurationError("The range of values is not divided equally into " +
            std::to_string(sectionCount) + " sections");
    }
    return partition(domainSize, domainSize / sectionCount);
}
