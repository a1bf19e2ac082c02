#pragma once

#include <cstdint>
#include <string>
#include <map>
#include <mutex>
#include <ostream>
#include <sstream>

namespace capsolve {

namespace metric {
inline constexpr const char* HASHES = "pow_hashes_total";
inline constexpr const char* CHALLENGES_SOLVED = "pow_challenges_solved_total";
inline constexpr const char* BATCHES_COMPLETED = "pow_batches_completed_total";
inline constexpr const char* BATCHES_FAILED = "pow_batches_failed_total";
inline constexpr const char* BATCHES_CANCELLED = "pow_batches_cancelled_total";
inline constexpr const char* ACTIVE_WORKERS = "pow_active_workers";
inline constexpr const char* POOL_SIZE = "pow_pool_size";
inline constexpr const char* LAST_BATCH_CHALLENGES = "pow_last_batch_challenges";
inline constexpr const char* LAST_BATCH_ELAPSED_MS = "pow_last_batch_elapsed_ms";
inline constexpr const char* LAST_BATCH_HASH_RATE = "pow_last_batch_hash_rate";
}

// Process-wide solver statistics: counters accumulate across batches, gauges
// describe the running pool and the most recent completed batch.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    /**
     * Publishes the summary of a batch that finished with a full solution.
     * The hash rate gauge is attempts per second, 0 when the batch took under 1 ms.
     */
    void record_batch(size_t challenges, uint64_t attempts, int64_t elapsed_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[metric::LAST_BATCH_CHALLENGES] = static_cast<double>(challenges);
        gauges_[metric::LAST_BATCH_ELAPSED_MS] = static_cast<double>(elapsed_ms);
        gauges_[metric::LAST_BATCH_HASH_RATE] =
            elapsed_ms > 0 ? static_cast<double>(attempts) * 1000.0 / static_cast<double>(elapsed_ms) : 0.0;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    // Prometheus text exposition format, version 0.0.4.
    void write_prometheus(std::ostream& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_family(out, counters_, "counter");
        write_family(out, gauges_, "gauge");
    }

    std::string collect_prometheus() {
        std::stringstream ss;
        write_prometheus(ss);
        return ss.str();
    }

private:
    MetricsRegistry() = default;

    static void write_family(std::ostream& out, const std::map<std::string, double>& values, const char* type) {
        for (const auto& [name, val] : values) {
            out << "# TYPE " << name << " " << type << "\n"
                << name << " " << val << "\n";
        }
    }

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

}
