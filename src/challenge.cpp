#include "challenge.hpp"
#include "pow_errors.hpp"
#include "token_seeder.hpp"

#include <algorithm>
#include <cstdio>

namespace capsolve {

void Xorshift32::append_hex(std::string& out, size_t length) {
    size_t start = out.size();
    char word[9];
    while (out.size() - start < length) {
        std::snprintf(word, sizeof(word), "%08x", static_cast<unsigned int>(next()));
        out.append(word, 8);
    }
    out.resize(start + length);
}

void ChallengeGenerator::check_params(const ChallengeParams& params) {
    if (params.count < 0) {
        throw InputError("challenge count must not be negative");
    }
    if (params.salt_length < 0) {
        throw InputError("salt length must not be negative");
    }
    if (!params.difficulties.empty() &&
        params.difficulties.size() != static_cast<size_t>(params.count)) {
        throw InputError("per-challenge difficulty list does not match challenge count");
    }
}

std::vector<ChallengeDescriptor> ChallengeGenerator::generate(uint32_t seed, const ChallengeParams& params) {
    check_params(params);

    std::vector<ChallengeDescriptor> challenges;
    challenges.reserve(static_cast<size_t>(params.count));

    Xorshift32 rng(seed);
    for (size_t i = 0; i < static_cast<size_t>(params.count); ++i) {
        ChallengeDescriptor challenge;
        challenge.index = i;
        rng.append_hex(challenge.salt, static_cast<size_t>(params.salt_length));
        challenge.target.assign(static_cast<size_t>(std::max(0, params.difficulty_for(i))), '0');
        challenges.push_back(std::move(challenge));
    }
    return challenges;
}

std::vector<ChallengeDescriptor> ChallengeGenerator::generate_for_token(const std::string& token,
                                                                        const ChallengeParams& params) {
    check_params(params);

    std::vector<ChallengeDescriptor> challenges;
    challenges.reserve(static_cast<size_t>(params.count));

    for (size_t i = 0; i < static_cast<size_t>(params.count); ++i) {
        std::string prefix = token + std::to_string(i + 1);
        ChallengeDescriptor challenge;
        challenge.index = i;
        challenge.salt = prng_hex(prefix, static_cast<size_t>(params.salt_length));
        challenge.target = prng_hex(prefix + "d", static_cast<size_t>(std::max(0, params.difficulty_for(i))));
        challenges.push_back(std::move(challenge));
    }
    return challenges;
}

std::string ChallengeGenerator::prng_hex(const std::string& seed, size_t length) {
    Xorshift32 rng(TokenSeeder::seed(seed));
    std::string out;
    out.reserve(length + 8);
    rng.append_hex(out, length);
    return out;
}

}
