#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace capsolve {

// Xorshift32 pseudo-random stream. The state is an explicit value owned by
// one generation call; a zero state stays zero.
struct Xorshift32 {
    uint32_t state;

    explicit Xorshift32(uint32_t seed) : state(seed) {}

    uint32_t next() {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        return state;
    }

    // Appends `length` lowercase hex characters, eight per draw.
    void append_hex(std::string& out, size_t length);
};

// One unit of work: find the smallest nonce whose SHA-256(salt + nonce)
// hex digest starts with `target`.
struct ChallengeDescriptor {
    size_t index = 0;
    std::string salt;
    std::string target;

    size_t target_prefix_length() const { return target.size(); }

    bool operator==(const ChallengeDescriptor& other) const {
        return index == other.index && salt == other.salt && target == other.target;
    }
};

struct ChallengeParams {
    int count = 0;
    int salt_length = 0;
    int difficulty = 0;              // leading hex characters required
    std::vector<int> difficulties;   // optional per-challenge override, size == count

    int difficulty_for(size_t index) const {
        return difficulties.empty() ? difficulty : difficulties[index];
    }
};

enum class ChallengeDerivation {
    SEED_STREAM,    // one Xorshift32 stream seeded from FNV-1a(token)
    PER_CHALLENGE   // Cap.js: independent streams seeded from token + index
};

class ChallengeGenerator {
public:
    /**
     * Expands a seed into `params.count` descriptors drawn from a single
     * Xorshift32 stream, in index order. Targets are `'0'` repeated
     * `difficulty` times; a difficulty <= 0 yields an empty target.
     * Throws InputError on a negative count or salt length, or on a
     * per-challenge difficulty list whose size differs from the count.
     */
    static std::vector<ChallengeDescriptor> generate(uint32_t seed, const ChallengeParams& params);

    /**
     * Cap.js derivation. Challenge i (1-based on the wire) gets
     * salt   = prng_hex(token + i, salt_length)
     * target = prng_hex(token + i + "d", difficulty)
     */
    static std::vector<ChallengeDescriptor> generate_for_token(const std::string& token,
                                                               const ChallengeParams& params);

    // Seeds Xorshift32 with FNV-1a(seed) and emits `length` hex characters.
    static std::string prng_hex(const std::string& seed, size_t length);

private:
    static void check_params(const ChallengeParams& params);
};

}
