#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "challenge.hpp"
#include "cancellation.hpp"

namespace capsolve {

struct SolveResult {
    size_t index = 0;
    uint64_t nonce = 0;
    std::string digest_hex;
};

// Exhaustive nonce search for a single challenge.
class BruteForceSolver {
public:
    // Attempts between two cancellation checks. Must be a power of two.
    static constexpr uint64_t CANCEL_CHECK_INTERVAL = 4096;

    /**
     * Returns the smallest nonce >= 0 whose digest matches the challenge target.
     * Nonces are tried strictly in increasing order and there is no upper bound.
     * @param challenge Descriptor produced by ChallengeGenerator.
     * @param cancel Optional stop signal, polled every CANCEL_CHECK_INTERVAL attempts.
     * @throws CancellationError when `cancel` requests a stop.
     * @throws SolverFault when the OpenSSL digest fails.
     * @throws InputError when the target is not a hex string of at most 64 characters.
     */
    static SolveResult solve(const ChallengeDescriptor& challenge, const CancellationToken* cancel = nullptr);

    // Target hex string to nibble values.
    static std::vector<uint8_t> decode_target(const std::string& target);
};

}
