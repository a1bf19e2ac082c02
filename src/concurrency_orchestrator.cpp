#include "concurrency_orchestrator.hpp"
#include "pow_errors.hpp"
#include "metrics.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace net = boost::asio;

namespace capsolve {

namespace {

// Keeps the active-worker gauge balanced however the task exits.
class ActiveWorkerGuard {
public:
    ActiveWorkerGuard() { MetricsRegistry::instance().increment_gauge(metric::ACTIVE_WORKERS); }
    ~ActiveWorkerGuard() { MetricsRegistry::instance().decrement_gauge(metric::ACTIVE_WORKERS); }

    ActiveWorkerGuard(const ActiveWorkerGuard&) = delete;
    ActiveWorkerGuard& operator=(const ActiveWorkerGuard&) = delete;
};

}

ConcurrencyOrchestrator::ConcurrencyOrchestrator(int worker_count, std::chrono::milliseconds timeout, SolveFn solve)
    : worker_count_(static_cast<size_t>(std::max(0, worker_count)))
    , timeout_(timeout)
    , solve_(std::move(solve))
{
    if (worker_count_ == 0) {
        worker_count_ = std::thread::hardware_concurrency();
        if (worker_count_ == 0) worker_count_ = 4;
    }
    if (!solve_) {
        solve_ = [](const ChallengeDescriptor& challenge, const CancellationToken* cancel) {
            return BruteForceSolver::solve(challenge, cancel);
        };
    }
}

std::vector<SolveResult> ConcurrencyOrchestrator::run(const std::vector<ChallengeDescriptor>& challenges,
                                                      const CancellationToken* cancel) const {
    if (challenges.empty()) return {};

    auto& metrics = MetricsRegistry::instance();

    std::optional<CancellationToken::Clock::time_point> deadline;
    if (timeout_ > std::chrono::milliseconds::zero()) {
        deadline = CancellationToken::Clock::now() + timeout_;
    }
    // Child of the caller's token; cancelled locally when a worker faults.
    CancellationToken batch(cancel, deadline);

    const size_t total = challenges.size();
    std::vector<std::optional<SolveResult>> slots(total);
    std::exception_ptr fault;
    size_t completed = 0;
    std::mutex mutex;

    {
        const size_t pool_size = std::min(worker_count_, total);
        metrics.set_gauge(metric::POOL_SIZE, static_cast<double>(pool_size));
        net::thread_pool pool(pool_size);

        for (size_t i = 0; i < total; ++i) {
            net::post(pool, [&, i]() {
                if (batch.stop_requested()) return;

                ActiveWorkerGuard active;
                try {
                    SolveResult result = solve_(challenges[i], &batch);
                    const uint64_t attempts = result.nonce + 1;

                    size_t done = 0;
                    {
                        std::lock_guard<std::mutex> lock(mutex);
                        slots[i] = std::move(result);
                        done = ++completed;
                    }

                    metrics.increment_counter(metric::HASHES, static_cast<double>(attempts));
                    metrics.increment_counter(metric::CHALLENGES_SOLVED);
                    if (progress_) progress_(done, total);
                } catch (const CancellationError&) {
                    // The batch token is already stopped; the outcome is decided after join.
                } catch (...) {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!fault) fault = std::current_exception();
                    batch.cancel();
                }
            });
        }

        pool.join();
    }

    if (fault) {
        metrics.increment_counter(metric::BATCHES_FAILED);
        try {
            std::rethrow_exception(fault);
        } catch (const PowError&) {
            throw;
        } catch (const std::exception& e) {
            throw SolverFault(e.what());
        }
    }

    if (batch.stop_requested() &&
        std::any_of(slots.begin(), slots.end(), [](const auto& slot) { return !slot.has_value(); })) {
        metrics.increment_counter(metric::BATCHES_CANCELLED);
        if (batch.reason() == CancellationToken::Reason::DEADLINE) {
            throw CancellationError("batch deadline of " + std::to_string(timeout_.count()) + " ms reached");
        }
        throw CancellationError("batch aborted by caller");
    }

    std::vector<SolveResult> results;
    results.reserve(total);
    for (auto& slot : slots) {
        if (!slot) {
            throw SolverFault("challenge left unsolved without an error");
        }
        results.push_back(std::move(*slot));
    }

    metrics.increment_counter(metric::BATCHES_COMPLETED);
    return results;
}

}
