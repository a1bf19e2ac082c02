#pragma once

#include <cstdint>
#include <string>

#include "challenge.hpp"

namespace capsolve {

// A Cap.js /challenge response body the caller has already fetched:
// {"challenge":{"c":50,"s":32,"d":4},"token":"...","expires":1700000000000}
struct ChallengeResponse {
    std::string token;
    ChallengeParams params;
    int64_t expires = 0;   // epoch milliseconds, 0 when absent

    // Throws InputError on malformed JSON or missing/mistyped fields.
    static ChallengeResponse parse(const std::string& body);
};

}
