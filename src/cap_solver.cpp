#include "cap_solver.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "result_assembler.hpp"
#include "solver_logger.hpp"
#include "token_seeder.hpp"
#include "pow_errors.hpp"

#include <algorithm>
#include <chrono>

namespace capsolve {

CapSolver::CapSolver(const SolverConfig& config)
    : config_(config)
    , orchestrator_(config.worker_count, std::chrono::milliseconds(config.timeout_ms))
{}

std::vector<ChallengeDescriptor> CapSolver::derive(const std::string& token, const ChallengeParams& params) const {
    try {
        InputValidator::require_valid_token(token, config_);
        InputValidator::require_valid_params(params, config_);
    } catch (const InputError& e) {
        SolverLogger::log(SolverLogger::Level::WARNING, SolverLogger::EventType::INVALID_INPUT, token, e.what());
        throw;
    }

    std::vector<ChallengeDescriptor> challenges;
    if (config_.derivation == ChallengeDerivation::PER_CHALLENGE) {
        challenges = ChallengeGenerator::generate_for_token(token, params);
    } else {
        challenges = ChallengeGenerator::generate(TokenSeeder::seed(token), params);
    }

    SolverLogger::log(SolverLogger::Level::DEBUG, SolverLogger::EventType::CHALLENGES_GENERATED, token,
                      "count=" + std::to_string(challenges.size()) +
                      " salt_length=" + std::to_string(params.salt_length) +
                      " difficulty=" + std::to_string(params.difficulty));
    return challenges;
}

std::vector<SolveResult> CapSolver::run(const std::string& token,
                                        const std::vector<ChallengeDescriptor>& challenges,
                                        const CancellationToken* cancel) const {
    if (challenges.empty()) return {};

    SolverLogger::log(SolverLogger::Level::INFO, SolverLogger::EventType::BATCH_STARTED, token,
                      "challenges=" + std::to_string(challenges.size()) +
                      " workers=" + std::to_string(std::min(orchestrator_.worker_count(), challenges.size())));

    auto start = std::chrono::steady_clock::now();
    std::vector<SolveResult> results;
    try {
        results = orchestrator_.run(challenges, cancel);
    } catch (const CancellationError& e) {
        SolverLogger::log(SolverLogger::Level::WARNING, SolverLogger::EventType::BATCH_CANCELLED, token, e.what());
        throw;
    } catch (const std::exception& e) {
        SolverLogger::log(SolverLogger::Level::ERROR, SolverLogger::EventType::BATCH_FAILED, token, e.what());
        throw;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    uint64_t attempts = 0;
    for (const auto& r : results) attempts += r.nonce + 1;

    std::string message = "elapsed_ms=" + std::to_string(elapsed) + " attempts=" + std::to_string(attempts);
    if (elapsed > 0) {
        message += " hash_rate=" + std::to_string(attempts * 1000 / static_cast<uint64_t>(elapsed)) + "H/s";
    }
    SolverLogger::log(SolverLogger::Level::INFO, SolverLogger::EventType::BATCH_COMPLETED, token, message);
    MetricsRegistry::instance().record_batch(results.size(), attempts, static_cast<int64_t>(elapsed));
    return results;
}

std::vector<SolveResult> CapSolver::solve_batch(const std::string& token, const ChallengeParams& params,
                                                const CancellationToken* cancel) const {
    return run(token, derive(token, params), cancel);
}

std::string CapSolver::solve(const std::string& token, const ChallengeParams& params,
                             const CancellationToken* cancel) const {
    std::vector<ChallengeDescriptor> challenges = derive(token, params);
    std::vector<SolveResult> results = run(token, challenges, cancel);

    std::vector<std::string> salts;
    if (config_.solution_format == SolutionFormat::DETAILED) {
        salts.reserve(challenges.size());
        for (const auto& c : challenges) salts.push_back(c.salt);
    }
    return ResultAssembler::assemble(results, config_.solution_format, token, salts);
}

}
