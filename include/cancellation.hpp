#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace capsolve {

// Cooperative stop signal shared between a caller and the solver workers.
// A token may be linked to a parent: stopping the parent stops every child,
// while cancelling a child leaves the parent untouched.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    enum class Reason {
        NONE,
        CANCELLED,
        DEADLINE
    };

    CancellationToken() = default;

    explicit CancellationToken(const CancellationToken* parent,
                               std::optional<Clock::time_point> deadline = std::nullopt)
        : parent_(parent), deadline_(deadline) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool stop_requested() const {
        return reason() != Reason::NONE;
    }

    Reason reason() const {
        if (cancelled_.load(std::memory_order_acquire)) return Reason::CANCELLED;
        if (parent_) {
            Reason inherited = parent_->reason();
            if (inherited != Reason::NONE) return inherited;
        }
        if (deadline_ && Clock::now() >= *deadline_) return Reason::DEADLINE;
        return Reason::NONE;
    }

private:
    std::atomic<bool> cancelled_{false};
    const CancellationToken* parent_ = nullptr;
    std::optional<Clock::time_point> deadline_;
};

}
