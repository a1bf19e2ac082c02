#include "challenge_response.hpp"
#include "input_validator.hpp"
#include "pow_errors.hpp"

#include <limits>

namespace json = boost::json;

namespace capsolve {

namespace {

int require_int(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw InputError(std::string("challenge response lacks '") + key + "'");
    }
    const json::value& v = it->value();
    int64_t n = 0;
    if (v.is_int64()) {
        n = v.as_int64();
    } else if (v.is_uint64() && v.as_uint64() <= static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        n = static_cast<int64_t>(v.as_uint64());
    } else {
        throw InputError(std::string("challenge field '") + key + "' is not an integer");
    }
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw InputError(std::string("challenge field '") + key + "' is out of range");
    }
    return static_cast<int>(n);
}

}

ChallengeResponse ChallengeResponse::parse(const std::string& body) {
    json::value root;
    try {
        root = InputValidator::safe_parse_json(body);
    } catch (const boost::system::system_error& e) {
        throw InputError(std::string("challenge response is not valid JSON: ") + e.what());
    }

    if (!root.is_object()) {
        throw InputError("challenge response is not a JSON object");
    }
    const auto& obj = root.as_object();

    ChallengeResponse response;

    auto token_it = obj.find("token");
    if (token_it == obj.end() || !token_it->value().is_string()) {
        throw InputError("challenge response lacks a string 'token'");
    }
    response.token = std::string(token_it->value().as_string());

    auto challenge_it = obj.find("challenge");
    if (challenge_it == obj.end() || !challenge_it->value().is_object()) {
        throw InputError("challenge response lacks a 'challenge' object");
    }
    const auto& challenge = challenge_it->value().as_object();
    response.params.count = require_int(challenge, "c");
    response.params.salt_length = require_int(challenge, "s");
    response.params.difficulty = require_int(challenge, "d");

    if (auto expires_it = obj.find("expires"); expires_it != obj.end()) {
        const json::value& v = expires_it->value();
        if (v.is_int64()) {
            response.expires = v.as_int64();
        } else if (v.is_uint64()) {
            response.expires = static_cast<int64_t>(v.as_uint64());
        } else if (v.is_double()) {
            double d = v.as_double();
            if (!(d >= 0.0 && d < 9.2e18)) {
                throw InputError("challenge field 'expires' is out of range");
            }
            response.expires = static_cast<int64_t>(d);
        } else if (!v.is_null()) {
            throw InputError("challenge field 'expires' is not a number");
        }
    }

    return response;
}

}
