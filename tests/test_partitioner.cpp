#include "core/DomainPartitioner.hpp"
#include "core/Errors.hpp"
#include "core/GeneratorConfig.hpp"
#include <gtest/gtest.h>

TEST(DomainPartitionerTest, HexDigitsToDomain) {
    EXPECT_EQ(DomainPartitioner::domainForHexDigits(1), 16u);
    EXPECT_EQ(DomainPartitioner::domainForHexDigits(4), 65536u);
    EXPECT_EQ(DomainPartitioner::domainForHexDigits(8), 4294967296ULL);
    EXPECT_EQ(DomainPartitioner::domainForHexDigits(15), 1ULL << 60);
}

TEST(DomainPartitionerTest, HexDigitsOutOfRange) {
    EXPECT_THROW(DomainPartitioner::domainForHexDigits(0), ConfigurationError);
    EXPECT_THROW(DomainPartitioner::domainForHexDigits(16), ConfigurationError);
}

TEST(DomainPartitionerTest, PartitionBySectionSize) {
    auto layout = DomainPartitioner::partition(100, 10);
    EXPECT_EQ(layout.domainSize, 100u);
    EXPECT_EQ(layout.sectionSize, 10u);
    EXPECT_EQ(layout.sectionCount, 10u);
}

TEST(DomainPartitionerTest, PartitionBySectionCount) {
    auto layout = DomainPartitioner::partitionBySections(1ULL << 32, 1024);
    EXPECT_EQ(layout.sectionCount, 1024u);
    EXPECT_EQ(layout.sectionSize, 1ULL << 22);
}

TEST(DomainPartitionerTest, RejectsInvalidConfigurations) {
    EXPECT_THROW(DomainPartitioner::partition(0, 10), ConfigurationError);
    EXPECT_THROW(DomainPartitioner::partition(100, 0), ConfigurationError);
    EXPECT_THROW(DomainPartitioner::partition(100, 7), ConfigurationError);
    EXPECT_THROW(DomainPartitioner::partition(100, 200), ConfigurationError);
    EXPECT_THROW(DomainPartitioner::partitionBySections(100, 0), ConfigurationError);
    EXPECT_THROW(DomainPartitioner::partitionBySections(100, 3), ConfigurationError);
}

TEST(DomainPartitionerTest, StartOffsets) {
    auto layout = DomainPartitioner::partition(100, 10);
    EXPECT_EQ(layout.startOffset(0), 0u);
    EXPECT_EQ(layout.startOffset(1), 11u);
    EXPECT_EQ(layout.startOffset(2), 22u);
    EXPECT_EQ(layout.startOffset(9), 99u);
}

// i mod M can push the raw offset into the next band; the emitted value
// stays inside the section's own band
TEST(DomainPartitionerTest, OffsetReducedIntoOwnBand) {
    auto layout = DomainPartitioner::partition(64, 4); // 16 sections of 4
    EXPECT_EQ(layout.startOffset(5), 25u);
    EXPECT_EQ(layout.valueAt(5, 0), 21u);
    EXPECT_EQ(layout.valueAt(5, 2), 23u);
    EXPECT_EQ(layout.valueAt(5, 3), 20u);
}

TEST(DomainPartitionerTest, BandsCoverDomainOnce) {
    auto layout = DomainPartitioner::partition(96, 12);
    uint64_t expectedMin = 0;
    for (uint64_t i = 0; i < layout.sectionCount; ++i) {
        EXPECT_EQ(layout.bandMin(i), expectedMin);
        EXPECT_EQ(layout.bandMax(i), expectedMin + 11);
        expectedMin = layout.bandMax(i) + 1;
    }
    EXPECT_EQ(expectedMin, layout.domainSize);
}

TEST(DomainPartitionerTest, SectionWalksItsBandAndWraps) {
    auto layout = DomainPartitioner::partition(100, 10);
    EXPECT_EQ(layout.valueAt(1, 0), 11u);
    EXPECT_EQ(layout.valueAt(1, 1), 12u);
    EXPECT_EQ(layout.valueAt(1, 8), 19u);
    EXPECT_EQ(layout.valueAt(1, 9), 10u);
}

TEST(GeneratorConfigTest, DefaultsMatchEightDigitCodes) {
    GeneratorConfig config;
    auto layout = config.layout();
    EXPECT_EQ(layout.domainSize, 1ULL << 32);
    EXPECT_EQ(layout.sectionCount, 1024u);
    EXPECT_EQ(config.resolvedStatePath(), "dig_8-div_1024.state");
}

TEST(GeneratorConfigTest, DefaultSectionsShrinkForShortCodes) {
    GeneratorConfig config;
    config.hexDigits = 1;
    EXPECT_EQ(config.layout().sectionCount, 16u);
    EXPECT_EQ(config.layout().sectionSize, 1u);
    EXPECT_EQ(config.defaultStatePath(), "dig_1-div_16.state");

    config.hexDigits = 2;
    EXPECT_EQ(config.layout().sectionCount, 256u);

    config.hexDigits = 3;
    EXPECT_EQ(config.layout().sectionCount, 1024u);
    EXPECT_EQ(config.layout().sectionSize, 4u);
}

TEST(GeneratorConfigTest, ExplicitSectionCountTooLargeThrows) {
    GeneratorConfig config;
    config.hexDigits = 2;
    config.sectionCount = 1024;
    EXPECT_THROW(config.layout(), ConfigurationError);
}

TEST(GeneratorConfigTest, SectionSizeWinsOverCount) {
    GeneratorConfig config;
    config.hexDigits = 2;
    config.sectionCount = 4;
    config.sectionSize = 16;
    auto layout = config.layout();
    EXPECT_EQ(layout.sectionCount, 16u);
    EXPECT_EQ(config.defaultStatePath(), "dig_2-div_16.state");

    config.statePath = "custom.state";
    EXPECT_EQ(config.resolvedStatePath(), "custom.state");
}

TEST(GeneratorConfigTest, InvalidCombinationThrows) {
    GeneratorConfig config;
    config.hexDigits = 2;
    config.sectionCount = 3;
    EXPECT_THROW(config.layout(), ConfigurationError);
}
