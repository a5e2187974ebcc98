#pragma once
#include <cstdint>

// Split of [0, domainSize) into sectionCount bands of sectionSize values.
struct DomainLayout {
    uint64_t domainSize = 0;
    uint64_t sectionSize = 0;
    uint64_t sectionCount = 0;

    // i*S + (i mod M). Only its residue mod S matters for the emitted values.
    uint64_t startOffset(uint64_t section) const;

    uint64_t bandMin(uint64_t section) const { return section * sectionSize; }
    uint64_t bandMax(uint64_t section) const { return bandMin(section) + sectionSize - 1; }

    // Value emitted by `section` after `cursor` previous emissions in its pass.
    uint64_t valueAt(uint64_t section, uint64_t cursor) const;

    bool operator==(const DomainLayout& other) const = default;
};

class DomainPartitioner {
public:
    // 16^digits, digits in [1, 15].
    static uint64_t domainForHexDigits(unsigned digits);

    // Throws ConfigurationError unless domainSize > 0, sectionSize > 0 and
    // sectionSize divides domainSize.
    static DomainLayout partition(uint64_t domainSize, uint64_t sectionSize);

    static DomainLayout partitionBySections(uint64_t domainSize, uint64_t sectionCount);
};
