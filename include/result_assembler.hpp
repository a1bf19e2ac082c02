#pragma once

#include <string>
#include <vector>

namespace capsolve {

struct SolveResult;

enum class SolutionFormat {
    NONCE_LIST,   // "28,237,110"
    REDEEM_JSON,  // {"token":"...","solutions":[28,237,110]}
    DETAILED      // "salt:nonce:digest,salt:nonce:digest"
};

// Serializes ordered solve results into the payload the verification
// endpoint expects. Separators and field order are part of the wire contract.
class ResultAssembler {
public:
    /**
     * @param results Results ordered by index, indices exactly 0..N-1.
     * @param salts Salt for each index; only read by the DETAILED format.
     * @param token Challenge token; only read by the REDEEM_JSON format.
     * @throws InputError when results are out of order or salts are missing.
     */
    static std::string assemble(const std::vector<SolveResult>& results,
                                SolutionFormat format,
                                const std::string& token = "",
                                const std::vector<std::string>& salts = {});

    static std::string nonce_list(const std::vector<SolveResult>& results);
    static std::string redeem_body(const std::string& token, const std::vector<SolveResult>& results);
    static std::string detailed(const std::vector<SolveResult>& results, const std::vector<std::string>& salts);

private:
    static void check_order(const std::vector<SolveResult>& results);
};

}
