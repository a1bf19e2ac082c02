#include "pow_solver.hpp"
#include "pow_errors.hpp"
#include "pow_verifier.hpp"

#include <charconv>
#include <memory>
#include <system_error>
#include <openssl/evp.h>

namespace capsolve {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

constexpr size_t SHA256_HEX_LENGTH = 64;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool prefix_matches(const unsigned char* digest, const std::vector<uint8_t>& nibbles) {
    for (size_t i = 0; i < nibbles.size(); ++i) {
        unsigned char byte = digest[i / 2];
        uint8_t nibble = (i % 2 == 0) ? (byte >> 4) : (byte & 0x0F);
        if (nibble != nibbles[i]) return false;
    }
    return true;
}

}

std::vector<uint8_t> BruteForceSolver::decode_target(const std::string& target) {
    if (target.size() > SHA256_HEX_LENGTH) {
        throw InputError("target prefix longer than a SHA-256 digest");
    }
    std::vector<uint8_t> nibbles;
    nibbles.reserve(target.size());
    for (char c : target) {
        int v = hex_value(c);
        if (v < 0) {
            throw InputError("target prefix is not hexadecimal");
        }
        nibbles.push_back(static_cast<uint8_t>(v));
    }
    return nibbles;
}

SolveResult BruteForceSolver::solve(const ChallengeDescriptor& challenge, const CancellationToken* cancel) {
    const std::vector<uint8_t> nibbles = decode_target(challenge.target);

    EvpMdCtxPtr salted(EVP_MD_CTX_new());
    EvpMdCtxPtr work(EVP_MD_CTX_new());
    if (!salted || !work) {
        throw SolverFault("EVP_MD_CTX_new failed");
    }

    // The salt prefix is absorbed once; each attempt copies this state.
    if (EVP_DigestInit_ex(salted.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(salted.get(), challenge.salt.data(), challenge.salt.size()) != 1) {
        throw SolverFault("SHA-256 initialisation failed for challenge #" + std::to_string(challenge.index));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    char nonce_buf[24];

    for (uint64_t nonce = 0;; ++nonce) {
        if ((nonce & (CANCEL_CHECK_INTERVAL - 1)) == 0 && cancel && cancel->stop_requested()) {
            throw CancellationError("challenge #" + std::to_string(challenge.index) +
                                    " stopped after " + std::to_string(nonce) + " attempts");
        }

        auto [end, ec] = std::to_chars(nonce_buf, nonce_buf + sizeof(nonce_buf), nonce);
        if (ec != std::errc()) {
            throw SolverFault("nonce encoding failed");
        }

        if (EVP_MD_CTX_copy_ex(work.get(), salted.get()) != 1 ||
            EVP_DigestUpdate(work.get(), nonce_buf, static_cast<size_t>(end - nonce_buf)) != 1 ||
            EVP_DigestFinal_ex(work.get(), digest, &digest_len) != 1) {
            throw SolverFault("SHA-256 digest failed for challenge #" + std::to_string(challenge.index));
        }

        if (prefix_matches(digest, nibbles)) {
            return SolveResult{
                .index = challenge.index,
                .nonce = nonce,
                .digest_hex = PoWVerifier::to_hex(digest, digest_len)
            };
        }
    }
}

}
