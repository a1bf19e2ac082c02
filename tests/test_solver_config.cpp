#include <gtest/gtest.h>
#include "solver_config.hpp"
#include "pow_errors.hpp"
#include <cstdlib>

using namespace capsolve;

class SolverConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"CAPSOLVE_WORKERS", "CAPSOLVE_TIMEOUT_MS", "CAPSOLVE_DERIVATION",
                                 "CAPSOLVE_FORMAT", "CAPSOLVE_MAX_DIFFICULTY"}) {
            unsetenv(name);
        }
    }
};

TEST_F(SolverConfigTest, DefaultValues) {
    SolverConfig config;
    EXPECT_EQ(config.worker_count, 0);
    EXPECT_EQ(config.timeout_ms, 30000);
    EXPECT_EQ(config.derivation, ChallengeDerivation::SEED_STREAM);
    EXPECT_EQ(config.solution_format, SolutionFormat::NONCE_LIST);
    EXPECT_EQ(config.default_params.count, 50);
    EXPECT_EQ(config.default_params.salt_length, 32);
    EXPECT_EQ(config.default_params.difficulty, 4);
    EXPECT_EQ(config.max_difficulty, 10);
    EXPECT_FALSE(config.verbose);
}

TEST_F(SolverConfigTest, EnvironmentOverrides) {
    setenv("CAPSOLVE_WORKERS", "3", 1);
    setenv("CAPSOLVE_TIMEOUT_MS", "1500", 1);
    setenv("CAPSOLVE_DERIVATION", "capjs", 1);
    setenv("CAPSOLVE_FORMAT", "redeem", 1);
    setenv("CAPSOLVE_MAX_DIFFICULTY", "6", 1);

    SolverConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.worker_count, 3);
    EXPECT_EQ(config.timeout_ms, 1500);
    EXPECT_EQ(config.derivation, ChallengeDerivation::PER_CHALLENGE);
    EXPECT_EQ(config.solution_format, SolutionFormat::REDEEM_JSON);
    EXPECT_EQ(config.max_difficulty, 6);
}

TEST_F(SolverConfigTest, MalformedEnvironment) {
    SolverConfig config;

    setenv("CAPSOLVE_WORKERS", "many", 1);
    EXPECT_THROW(apply_env_overrides(config), InputError);
    setenv("CAPSOLVE_WORKERS", "4x", 1);
    EXPECT_THROW(apply_env_overrides(config), InputError);
    setenv("CAPSOLVE_WORKERS", "-1", 1);
    EXPECT_THROW(apply_env_overrides(config), InputError);
    unsetenv("CAPSOLVE_WORKERS");

    setenv("CAPSOLVE_DERIVATION", "sha1", 1);
    EXPECT_THROW(apply_env_overrides(config), InputError);
    unsetenv("CAPSOLVE_DERIVATION");

    setenv("CAPSOLVE_FORMAT", "xml", 1);
    EXPECT_THROW(apply_env_overrides(config), InputError);
}

TEST_F(SolverConfigTest, NameParsing) {
    EXPECT_EQ(parse_derivation("stream"), ChallengeDerivation::SEED_STREAM);
    EXPECT_EQ(parse_derivation("capjs"), ChallengeDerivation::PER_CHALLENGE);
    EXPECT_EQ(parse_solution_format("nonces"), SolutionFormat::NONCE_LIST);
    EXPECT_EQ(parse_solution_format("detailed"), SolutionFormat::DETAILED);
}

TEST_F(SolverConfigTest, NamesRoundTrip) {
    for (auto d : {ChallengeDerivation::SEED_STREAM, ChallengeDerivation::PER_CHALLENGE}) {
        EXPECT_EQ(parse_derivation(to_string(d)), d);
    }
    for (auto f : {SolutionFormat::NONCE_LIST, SolutionFormat::REDEEM_JSON, SolutionFormat::DETAILED}) {
        EXPECT_EQ(parse_solution_format(to_string(f)), f);
    }
}

TEST_F(SolverConfigTest, DescribeSummarizesEffectiveConfig) {
    SolverConfig config;
    EXPECT_EQ(describe(config).rfind("workers=0 timeout_ms=30000 derivation=stream format=nonces", 0), 0u);
    EXPECT_NE(describe(config).find("max_difficulty=10"), std::string::npos);

    config.worker_count = 6;
    config.derivation = ChallengeDerivation::PER_CHALLENGE;
    config.solution_format = SolutionFormat::REDEEM_JSON;
    EXPECT_EQ(describe(config).rfind("workers=6 timeout_ms=30000 derivation=capjs format=redeem", 0), 0u);
}
