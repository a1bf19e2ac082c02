#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <vector>

#include "challenge.hpp"
#include "cancellation.hpp"
#include "pow_solver.hpp"

namespace capsolve {

// Fans a batch of challenges out to a bounded worker pool and collects the
// results back in index order. The batch is all-or-nothing.
class ConcurrencyOrchestrator {
public:
    using SolveFn = std::function<SolveResult(const ChallengeDescriptor&, const CancellationToken*)>;
    using ProgressFn = std::function<void(size_t completed, size_t total)>;

    /**
     * @param worker_count Pool size; 0 selects the hardware concurrency.
     * @param timeout Whole-batch deadline; zero disables it.
     * @param solve Per-challenge solver, BruteForceSolver::solve when empty.
     */
    explicit ConcurrencyOrchestrator(int worker_count = 0,
                                     std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
                                     SolveFn solve = {});

    void set_progress_callback(ProgressFn progress) { progress_ = std::move(progress); }

    size_t worker_count() const { return worker_count_; }

    /**
     * Solves every challenge exactly once. Returns results in the order of
     * `challenges`, whatever order the workers finish in.
     * @throws CancellationError on external cancel or deadline, after all workers stopped.
     * @throws SolverFault (or the worker's PowError) when any challenge fails.
     */
    std::vector<SolveResult> run(const std::vector<ChallengeDescriptor>& challenges,
                                 const CancellationToken* cancel = nullptr) const;

private:
    size_t worker_count_;
    std::chrono::milliseconds timeout_;
    SolveFn solve_;
    ProgressFn progress_;
};

}
