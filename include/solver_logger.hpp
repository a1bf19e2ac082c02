#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <cctype>
#include <ctime>
#include <openssl/sha.h>

namespace capsolve {

// Structured single-line logging for solver activity.
// Challenge tokens are single-use credentials, so only a fingerprint is written.
// Records go to stderr; stdout is reserved for the solution payload.
class SolverLogger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    enum class EventType {
        CHALLENGE_RECEIVED,
        CHALLENGES_GENERATED,
        BATCH_STARTED,
        BATCH_PROGRESS,
        BATCH_COMPLETED,
        BATCH_FAILED,
        BATCH_CANCELLED,
        INVALID_INPUT,
        CONFIG
    };

    static void set_min_level(Level level) {
        min_level().store(level);
    }

    /**
     * Records a solver event.
     * @param level Severity; records below the process-wide minimum are dropped.
     * @param event The kind of event.
     * @param token Challenge token the event belongs to (fingerprinted before logging).
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& token,
                    const std::string& message = "") {
        if (level < min_level().load()) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "tok=" << fingerprint(token);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        std::cerr << ss.str() << "\n";
    }

    // "tok_" followed by the first six bytes of SHA-256(token) in hex.
    static std::string fingerprint(const std::string& token) {
        if (token.empty()) return "none";

        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(token.data()), token.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "tok_" + hs.str();
    }

    // Replaces quotes and line breaks with spaces and drops non-printables.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::CHALLENGE_RECEIVED: return "CHALLENGE";
            case EventType::CHALLENGES_GENERATED: return "GENERATED";
            case EventType::BATCH_STARTED: return "BATCH_START";
            case EventType::BATCH_PROGRESS: return "PROGRESS";
            case EventType::BATCH_COMPLETED: return "BATCH_DONE";
            case EventType::BATCH_FAILED: return "BATCH_FAILED";
            case EventType::BATCH_CANCELLED: return "BATCH_CANCELLED";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::CONFIG: return "CONFIG";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
