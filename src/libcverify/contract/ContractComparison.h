#pragma once

#include <libcverify/contract/ContractDocument.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>
#include <string>
#include <vector>

namespace cverify {

enum class ClauseStatus { match, differ, onlyInBaseline, onlyInCandidate };

std::string to_string(ClauseStatus status);

struct ClauseDelta {
    std::size_t index = 0;  // 0-based clause position
    ClauseStatus status = ClauseStatus::match;
    std::string baseline;   // empty when onlyInCandidate
    std::string candidate;  // empty when onlyInBaseline
};

struct ContractComparison {
    merkle::Digest baselineRoot;
    merkle::Digest candidateRoot;
    bool identical = false;

    // False when roots matched, or when either side had no clauses.
    bool clauseLevel = false;
    std::vector<ClauseDelta> clauses;

    std::size_t differences() const;

    Json::Value getJson() const;
};

inline bool sameRoot(const merkle::Digest& a, const merkle::Digest& b) {
    return a == b;
}

/**
 * Compare two versions of a contract.
 *
 * Roots are compared first. Only when they differ, and both documents have
 * clauses, is each clause position compared by digest; clauses past the end
 * of the shorter document are reported as belonging to one side only.
 */
ContractComparison compareContracts(
    const ContractDocument& baseline,
    const ContractDocument& candidate,
    beast::Journal j);

} // namespace cverify
