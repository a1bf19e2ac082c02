#include "result_assembler.hpp"
#include "pow_solver.hpp"
#include "pow_errors.hpp"

#include <boost/json.hpp>

namespace json = boost::json;

namespace capsolve {

void ResultAssembler::check_order(const std::vector<SolveResult>& results) {
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].index != i) {
            throw InputError("result at position " + std::to_string(i) +
                             " carries index " + std::to_string(results[i].index));
        }
    }
}

std::string ResultAssembler::nonce_list(const std::vector<SolveResult>& results) {
    check_order(results);
    std::string out;
    for (const auto& r : results) {
        if (!out.empty()) out += ',';
        out += std::to_string(r.nonce);
    }
    return out;
}

// Cap.js /redeem request body. Solutions are bare JSON numbers in index order.
std::string ResultAssembler::redeem_body(const std::string& token, const std::vector<SolveResult>& results) {
    check_order(results);
    json::array solutions;
    solutions.reserve(results.size());
    for (const auto& r : results) {
        solutions.emplace_back(r.nonce);
    }

    json::object body;
    body["token"] = token;
    body["solutions"] = std::move(solutions);
    return json::serialize(body);
}

std::string ResultAssembler::detailed(const std::vector<SolveResult>& results, const std::vector<std::string>& salts) {
    check_order(results);
    if (salts.size() != results.size()) {
        throw InputError("detailed format needs one salt per result");
    }
    std::string out;
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) out += ',';
        out += salts[i];
        out += ':';
        out += std::to_string(results[i].nonce);
        out += ':';
        out += results[i].digest_hex;
    }
    return out;
}

std::string ResultAssembler::assemble(const std::vector<SolveResult>& results,
                                      SolutionFormat format,
                                      const std::string& token,
                                      const std::vector<std::string>& salts) {
    switch (format) {
        case SolutionFormat::NONCE_LIST: return nonce_list(results);
        case SolutionFormat::REDEEM_JSON: return redeem_body(token, results);
        case SolutionFormat::DETAILED: return detailed(results, salts);
    }
    throw InputError("unsupported solution format");
}

}
