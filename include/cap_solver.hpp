#pragma once

#include <string>
#include <vector>

#include "challenge.hpp"
#include "cancellation.hpp"
#include "concurrency_orchestrator.hpp"
#include "pow_solver.hpp"
#include "solver_config.hpp"

namespace capsolve {

// Token in, solution payload out: validation, challenge derivation,
// parallel solving and serialization in one call.
class CapSolver {
public:
    explicit CapSolver(const SolverConfig& config);

    const SolverConfig& config() const { return config_; }

    void set_progress_callback(ConcurrencyOrchestrator::ProgressFn progress) {
        orchestrator_.set_progress_callback(std::move(progress));
    }

    // Validates the inputs and derives the descriptor list for `token`.
    std::vector<ChallengeDescriptor> derive(const std::string& token, const ChallengeParams& params) const;

    // Derives and solves; results are ordered by challenge index.
    std::vector<SolveResult> solve_batch(const std::string& token, const ChallengeParams& params,
                                         const CancellationToken* cancel = nullptr) const;

    /**
     * Full pipeline. Returns the serialized solution in `config().solution_format`.
     * Failures propagate as InputError, SolverFault or CancellationError and
     * no partial solution is ever returned.
     *
     * The token must be printable ASCII (0x20-0x7E). Any other byte, including
     * every byte of a multi-byte UTF-8 sequence, fails fast with InputError
     * before a single hash is computed.
     */
    std::string solve(const std::string& token, const ChallengeParams& params,
                      const CancellationToken* cancel = nullptr) const;

private:
    std::vector<SolveResult> run(const std::string& token,
                                 const std::vector<ChallengeDescriptor>& challenges,
                                 const CancellationToken* cancel) const;

    SolverConfig config_;
    ConcurrencyOrchestrator orchestrator_;
};

}
