#pragma once

#include <string>
#include <algorithm>
#include <boost/json.hpp>

#include "challenge.hpp"
#include "solver_config.hpp"
#include "pow_errors.hpp"

namespace capsolve {

// Fail-fast checks applied before any solving work starts.
class InputValidator {
public:
    static bool is_printable_ascii(const std::string& str) {
        return std::all_of(str.begin(), str.end(), [](char c) {
            unsigned char u = static_cast<unsigned char>(c);
            return u >= 0x20 && u < 0x7f;
        });
    }

    static void require_valid_token(const std::string& token, const SolverConfig& config) {
        if (token.empty()) {
            throw InputError("challenge token is empty");
        }
        if (token.size() > config.max_token_length) {
            throw InputError("challenge token exceeds " + std::to_string(config.max_token_length) + " bytes");
        }
        if (!is_printable_ascii(token)) {
            throw InputError("challenge token contains non-printable characters");
        }
    }

    static void require_valid_params(const ChallengeParams& params, const SolverConfig& config) {
        if (params.count < 0 || params.count > config.max_challenge_count) {
            throw InputError("challenge count " + std::to_string(params.count) +
                             " outside [0, " + std::to_string(config.max_challenge_count) + "]");
        }
        if (params.salt_length < 1 || params.salt_length > config.max_salt_length) {
            throw InputError("salt length " + std::to_string(params.salt_length) +
                             " outside [1, " + std::to_string(config.max_salt_length) + "]");
        }
        if (!params.difficulties.empty() &&
            params.difficulties.size() != static_cast<size_t>(params.count)) {
            throw InputError("per-challenge difficulty list does not match challenge count");
        }

        const int limit = std::min(config.max_difficulty, 64);
        auto check_difficulty = [limit](int d) {
            if (d < 0 || d > limit) {
                throw InputError("difficulty " + std::to_string(d) +
                                 " outside [0, " + std::to_string(limit) + "]");
            }
        };
        check_difficulty(params.difficulty);
        std::for_each(params.difficulties.begin(), params.difficulties.end(), check_difficulty);
    }

    /**
     * JSON parsing with a recursion depth limit to bound stack use on hostile input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }
};

}
