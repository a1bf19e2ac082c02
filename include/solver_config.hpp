#pragma once

#include <string>
#include <cstddef>

#include "challenge.hpp"
#include "result_assembler.hpp"

namespace capsolve {

// Runtime configuration and input limits for the solver.
struct SolverConfig {
    // --- Execution ---
    int worker_count = 0;   // 0 defaults to hardware concurrency
    int timeout_ms = 30000; // whole-batch deadline; 0 disables it

    // --- Protocol ---
    ChallengeDerivation derivation = ChallengeDerivation::SEED_STREAM;
    SolutionFormat solution_format = SolutionFormat::NONCE_LIST;

    // Cap.js widget defaults, used when the caller supplies no parameters
    ChallengeParams default_params{.count = 50, .salt_length = 32, .difficulty = 4, .difficulties = {}};

    // --- Input Limits ---
    int max_challenge_count = 10000;
    int max_salt_length = 1024;
    int max_difficulty = 10;
    size_t max_token_length = 4096;

    bool verbose = false;
};

// Reads CAPSOLVE_* environment variables into `config`. Throws InputError on
// a malformed value.
void apply_env_overrides(SolverConfig& config);

ChallengeDerivation parse_derivation(const std::string& name);
SolutionFormat parse_solution_format(const std::string& name);

std::string to_string(ChallengeDerivation derivation);
std::string to_string(SolutionFormat format);

// One-line key=value summary of the effective configuration, for the startup log.
std::string describe(const SolverConfig& config);

}
