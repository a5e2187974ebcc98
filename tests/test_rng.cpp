#include "utils/RNG.hpp"
#include "core/rngFactory.hpp"
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>


// OSCSPRNG returns the requested number of bytes and not all of them are zero
TEST(RNGTest, OSCSPRNG_Works) {
    utils::OSCSPRNG rng;
    auto bytes = rng.randomBytes(16);

    EXPECT_EQ(bytes.size(), 16);

    bool hasNonZero = false;
    for (auto b : bytes) {
        if (b != 0) {
            hasNonZero = true;
            break;
        }
    }
    EXPECT_TRUE(hasNonZero);
}

TEST(RNGTest, OpenSSLCSPRNG_Works) {
    utils::OpenSSLCSPRNG rng;
    auto a = rng.randomBytes(32);
    auto b = rng.randomBytes(32);

    EXPECT_EQ(a.size(), 32);
    EXPECT_NE(a, b);
    EXPECT_TRUE(rng.randomBytes(0).empty());
}

// Same seed, same stream
TEST(RNGTest, TestCSPRNG_Deterministic) {
    utils::TestCSPRNG rng1;
    utils::TestCSPRNG rng2;

    EXPECT_EQ(rng1.randomBytes(16), rng2.randomBytes(16));

    utils::TestCSPRNG seeded1(42);
    utils::TestCSPRNG seeded2(42);
    EXPECT_EQ(seeded1.randomUint64(), seeded2.randomUint64());
}

TEST(RNGTest, TestCSPRNG_SeedsDiffer) {
    utils::TestCSPRNG rng1(1);
    utils::TestCSPRNG rng2(2);

    EXPECT_NE(rng1.randomBytes(16), rng2.randomBytes(16));
}

// Even/odd split stays close to half
TEST(RNGTest, CSPRNG_Distribution) {
    utils::TestCSPRNG rng;
    int evenCount = 0;
    int oddCount = 0;

    for (int i = 0; i < 10000; i++) {
        uint64_t n = rng.randomUint64();
        if (n % 2 == 0) evenCount++;
        else oddCount++;
    }

    EXPECT_NEAR(evenCount, 5000, 300);
    EXPECT_NEAR(oddCount, 5000, 300);
}

TEST(RNGTest, RandomBelowStaysInRange) {
    utils::TestCSPRNG rng(7);
    std::set<uint64_t> seen;

    for (int i = 0; i < 2000; i++) {
        uint64_t v = rng.randomBelow(10);
        ASSERT_LT(v, 10u);
        seen.insert(v);
    }
    // 2000 draws over 10 buckets hit every bucket
    EXPECT_EQ(seen.size(), 10u);

    EXPECT_EQ(rng.randomBelow(1), 0u);
}

TEST(RNGTest, RandomBelowRejectsZeroBound) {
    utils::TestCSPRNG rng;
    EXPECT_THROW(rng.randomBelow(0), std::invalid_argument);
}

TEST(RngFactoryTest, CreatesKnownSources) {
    EXPECT_NE(dynamic_cast<utils::OSCSPRNG*>(RngFactory::create("os").get()), nullptr);
    EXPECT_NE(dynamic_cast<utils::OpenSSLCSPRNG*>(RngFactory::create("openssl").get()), nullptr);
    EXPECT_NE(dynamic_cast<utils::TestCSPRNG*>(RngFactory::create("test").get()), nullptr);
}

TEST(RngFactoryTest, SeedReachesTestSource) {
    auto a = RngFactory::create("test", 99);
    utils::TestCSPRNG b(99);
    EXPECT_EQ(a->randomUint64(), b.randomUint64());
}

TEST(RngFactoryTest, SeedRejectedForSystemSources) {
    EXPECT_THROW(RngFactory::create("os", 5), std::invalid_argument);
    EXPECT_THROW(RngFactory::create("openssl", 5), std::invalid_argument);
    EXPECT_NO_THROW(RngFactory::create("os", 0));
}

TEST(RngFactoryTest, UnknownSourceThrows) {
    EXPECT_THROW(RngFactory::create("dice"), std::runtime_error);
}
