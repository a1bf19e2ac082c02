#include <gtest/gtest.h>
#include "challenge.hpp"
#include "pow_errors.hpp"

using namespace capsolve;

TEST(ChallengeTest, XorshiftKnownSequence) {
    Xorshift32 rng(123456789u);
    EXPECT_EQ(rng.next(), 0xa1d31f49u);
    EXPECT_EQ(rng.next(), 0x857194d4u);
    EXPECT_EQ(rng.next(), 0x4a82ab01u);

    Xorshift32 one(1u);
    EXPECT_EQ(one.next(), 0x00042021u);
    EXPECT_EQ(one.next(), 0x04080601u);
    EXPECT_EQ(one.next(), 0x9dcca8c5u);
}

TEST(ChallengeTest, XorshiftZeroIsFixedPoint) {
    Xorshift32 rng(0u);
    EXPECT_EQ(rng.next(), 0u);
    EXPECT_EQ(rng.next(), 0u);
}

TEST(ChallengeTest, GoldenSeedStream) {
    ChallengeParams params{.count = 3, .salt_length = 8, .difficulty = 2, .difficulties = {}};
    auto challenges = ChallengeGenerator::generate(123456789u, params);

    ASSERT_EQ(challenges.size(), 3u);
    EXPECT_EQ(challenges[0].salt, "a1d31f49");
    EXPECT_EQ(challenges[1].salt, "857194d4");
    EXPECT_EQ(challenges[2].salt, "4a82ab01");
    for (size_t i = 0; i < challenges.size(); ++i) {
        EXPECT_EQ(challenges[i].index, i);
        EXPECT_EQ(challenges[i].target, "00");
        EXPECT_EQ(challenges[i].target_prefix_length(), 2u);
    }
}

TEST(ChallengeTest, SaltLengthConsumesWholeDraws) {
    // 12 characters take two draws; the unused half of the second is dropped.
    ChallengeParams longer{.count = 2, .salt_length = 12, .difficulty = 1, .difficulties = {}};
    auto a = ChallengeGenerator::generate(123456789u, longer);
    EXPECT_EQ(a[0].salt, "a1d31f498571");
    EXPECT_EQ(a[1].salt, "4a82ab01e3b2");

    ChallengeParams shorter{.count = 2, .salt_length = 3, .difficulty = 1, .difficulties = {}};
    auto b = ChallengeGenerator::generate(123456789u, shorter);
    EXPECT_EQ(b[0].salt, "a1d");
    EXPECT_EQ(b[1].salt, "857");
}

TEST(ChallengeTest, Determinism) {
    ChallengeParams params{.count = 20, .salt_length = 32, .difficulty = 4, .difficulties = {}};
    auto first = ChallengeGenerator::generate(987654321u, params);
    for (int run = 0; run < 5; ++run) {
        EXPECT_EQ(ChallengeGenerator::generate(987654321u, params), first);
    }
    EXPECT_NE(ChallengeGenerator::generate(987654322u, params), first);
}

TEST(ChallengeTest, ZeroCountIsEmpty) {
    ChallengeParams params{.count = 0, .salt_length = 8, .difficulty = 2, .difficulties = {}};
    EXPECT_TRUE(ChallengeGenerator::generate(1u, params).empty());
    EXPECT_TRUE(ChallengeGenerator::generate_for_token("tok", params).empty());
}

TEST(ChallengeTest, NonPositiveDifficultyGivesEmptyTarget) {
    ChallengeParams params{.count = 2, .salt_length = 8, .difficulty = 0, .difficulties = {}};
    for (const auto& c : ChallengeGenerator::generate(5u, params)) {
        EXPECT_TRUE(c.target.empty());
    }
    params.difficulty = -3;
    for (const auto& c : ChallengeGenerator::generate(5u, params)) {
        EXPECT_TRUE(c.target.empty());
    }
}

TEST(ChallengeTest, PerChallengeDifficulty) {
    ChallengeParams params{.count = 3, .salt_length = 8, .difficulty = 9, .difficulties = {0, 1, 3}};
    auto challenges = ChallengeGenerator::generate(123456789u, params);
    EXPECT_EQ(challenges[0].target, "");
    EXPECT_EQ(challenges[1].target, "0");
    EXPECT_EQ(challenges[2].target, "000");
    // Difficulty does not consume PRNG draws.
    EXPECT_EQ(challenges[2].salt, "4a82ab01");
}

TEST(ChallengeTest, RejectsBadParams) {
    ChallengeParams negative{.count = -1, .salt_length = 8, .difficulty = 2, .difficulties = {}};
    EXPECT_THROW(ChallengeGenerator::generate(1u, negative), InputError);

    ChallengeParams bad_salt{.count = 1, .salt_length = -8, .difficulty = 2, .difficulties = {}};
    EXPECT_THROW(ChallengeGenerator::generate(1u, bad_salt), InputError);

    ChallengeParams mismatch{.count = 3, .salt_length = 8, .difficulty = 2, .difficulties = {1, 2}};
    EXPECT_THROW(ChallengeGenerator::generate(1u, mismatch), InputError);
    EXPECT_THROW(ChallengeGenerator::generate_for_token("tok", mismatch), InputError);
}

TEST(ChallengeTest, PrngHexKnownValues) {
    EXPECT_EQ(ChallengeGenerator::prng_hex("test", 16), "9c7ca3730a4a283a");
    EXPECT_EQ(ChallengeGenerator::prng_hex("test", 3), "9c7");
    EXPECT_EQ(ChallengeGenerator::prng_hex("", 8), "4622a677");
    EXPECT_EQ(ChallengeGenerator::prng_hex("test", 0), "");
}

TEST(ChallengeTest, GoldenPerChallengeDerivation) {
    ChallengeParams params{.count = 3, .salt_length = 32, .difficulty = 4, .difficulties = {}};
    auto challenges = ChallengeGenerator::generate_for_token("a1b2c3d4e5f60718", params);

    ASSERT_EQ(challenges.size(), 3u);
    EXPECT_EQ(challenges[0].salt, "0ff90067d14b043d885367bb702ac8c9");
    EXPECT_EQ(challenges[0].target, "a704");
    EXPECT_EQ(challenges[1].salt, "2172cb657bd4ba2a7ea00022aa2b9170");
    EXPECT_EQ(challenges[1].target, "b40b");
    EXPECT_EQ(challenges[2].salt, "58ec435fc07ea89cb8c9676a10a9c278");
    EXPECT_EQ(challenges[2].target, "65cf");
    EXPECT_EQ(challenges[2].index, 2u);
}
