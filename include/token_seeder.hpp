#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace capsolve {

// Derives the 32-bit PRNG seed from a server-issued challenge token.
// FNV-1a over the raw token bytes; all arithmetic wraps modulo 2^32.
class TokenSeeder {
public:
    static constexpr uint32_t FNV_OFFSET_BASIS = 0x811c9dc5u;
    static constexpr uint32_t FNV_PRIME = 0x01000193u;

    static uint32_t fnv1a(const unsigned char* data, size_t len) {
        uint32_t hash = FNV_OFFSET_BASIS;
        for (size_t i = 0; i < len; ++i) {
            hash ^= data[i];
            hash *= FNV_PRIME;
        }
        return hash;
    }

    static uint32_t seed(std::string_view token) {
        return fnv1a(reinterpret_cast<const unsigned char*>(token.data()), token.size());
    }
};

}
