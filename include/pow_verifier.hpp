#pragma once

#include <string>
#include <cstdint>
#include <cctype>
#include <openssl/sha.h>

namespace capsolve {

// SHA-256 prefix check for Cap.js proof-of-work answers.
// The hashed input is the salt followed by the decimal nonce, no separator.
class PoWVerifier {
public:
    static std::string to_hex(const unsigned char* data, size_t len) {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            out += digits[data[i] >> 4];
            out += digits[data[i] & 0x0F];
        }
        return out;
    }

    static std::string digest_hex(const std::string& salt, uint64_t nonce) {
        std::string input = salt + std::to_string(nonce);
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
        return to_hex(hash, SHA256_DIGEST_LENGTH);
    }

    // True when `digest` starts with `target`, ignoring hex letter case.
    static bool matches_target(const std::string& digest, const std::string& target) {
        if (target.size() > digest.size()) return false;
        for (size_t i = 0; i < target.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(digest[i])) !=
                std::tolower(static_cast<unsigned char>(target[i]))) {
                return false;
            }
        }
        return true;
    }

    /**
     * Recomputes the digest for a submitted answer.
     * @param salt Challenge salt.
     * @param nonce Candidate answer.
     * @param target Required hex prefix; empty accepts every nonce.
     */
    static bool verify(const std::string& salt, uint64_t nonce, const std::string& target) {
        return matches_target(digest_hex(salt, nonce), target);
    }
};

}
