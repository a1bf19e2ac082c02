#include "solver_config.hpp"
#include "pow_errors.hpp"

#include <cstdlib>
#include <stdexcept>

namespace capsolve {

namespace {

int parse_int(const char* name, const char* value) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (value[pos] != '\0') {
            throw InputError(std::string(name) + " has trailing characters");
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw InputError(std::string(name) + " is not a number");
    } catch (const std::out_of_range&) {
        throw InputError(std::string(name) + " is out of range");
    }
}

}

ChallengeDerivation parse_derivation(const std::string& name) {
    if (name == "stream") return ChallengeDerivation::SEED_STREAM;
    if (name == "capjs") return ChallengeDerivation::PER_CHALLENGE;
    throw InputError("unknown derivation '" + name + "'");
}

SolutionFormat parse_solution_format(const std::string& name) {
    if (name == "nonces") return SolutionFormat::NONCE_LIST;
    if (name == "redeem") return SolutionFormat::REDEEM_JSON;
    if (name == "detailed") return SolutionFormat::DETAILED;
    throw InputError("unknown solution format '" + name + "'");
}

std::string to_string(ChallengeDerivation derivation) {
    switch (derivation) {
        case ChallengeDerivation::SEED_STREAM: return "stream";
        case ChallengeDerivation::PER_CHALLENGE: return "capjs";
    }
    return "unknown";
}

std::string to_string(SolutionFormat format) {
    switch (format) {
        case SolutionFormat::NONCE_LIST: return "nonces";
        case SolutionFormat::REDEEM_JSON: return "redeem";
        case SolutionFormat::DETAILED: return "detailed";
    }
    return "unknown";
}

std::string describe(const SolverConfig& config) {
    return "workers=" + std::to_string(config.worker_count) +
           " timeout_ms=" + std::to_string(config.timeout_ms) +
           " derivation=" + to_string(config.derivation) +
           " format=" + to_string(config.solution_format) +
           " max_challenges=" + std::to_string(config.max_challenge_count) +
           " max_salt_length=" + std::to_string(config.max_salt_length) +
           " max_difficulty=" + std::to_string(config.max_difficulty) +
           " max_token_length=" + std::to_string(config.max_token_length);
}

void apply_env_overrides(SolverConfig& config) {
    if (const char* e = std::getenv("CAPSOLVE_WORKERS")) {
        config.worker_count = parse_int("CAPSOLVE_WORKERS", e);
        if (config.worker_count < 0) throw InputError("CAPSOLVE_WORKERS must not be negative");
    }
    if (const char* e = std::getenv("CAPSOLVE_TIMEOUT_MS")) {
        config.timeout_ms = parse_int("CAPSOLVE_TIMEOUT_MS", e);
        if (config.timeout_ms < 0) throw InputError("CAPSOLVE_TIMEOUT_MS must not be negative");
    }
    if (const char* e = std::getenv("CAPSOLVE_DERIVATION")) {
        config.derivation = parse_derivation(e);
    }
    if (const char* e = std::getenv("CAPSOLVE_FORMAT")) {
        config.solution_format = parse_solution_format(e);
    }
    if (const char* e = std::getenv("CAPSOLVE_MAX_DIFFICULTY")) {
        config.max_difficulty = parse_int("CAPSOLVE_MAX_DIFFICULTY", e);
    }
}

}
