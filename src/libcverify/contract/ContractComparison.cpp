#include "ContractComparison.h"
#include <xrpl/basics/Log.h>
#include <algorithm>
#include <utility>

namespace cverify {

std::string to_string(ClauseStatus status) {
    switch (status) {
        case ClauseStatus::match:
            return "match";
        case ClauseStatus::differ:
            return "differ";
        case ClauseStatus::onlyInBaseline:
            return "onlyInBaseline";
        case ClauseStatus::onlyInCandidate:
            return "onlyInCandidate";
    }
    return "unknown";
}

std::size_t ContractComparison::differences() const {
    return static_cast<std::size_t>(
        std::count_if(clauses.begin(), clauses.end(), [](const auto& d) {
            return d.status != ClauseStatus::match;
        }));
}

Json::Value ContractComparison::getJson() const {
    Json::Value ret(Json::objectValue);
    ret["baseline_root"] = baselineRoot;
    ret["candidate_root"] = candidateRoot;
    ret["identical"] = identical;
    ret["clause_level"] = clauseLevel;

    if (clauseLevel) {
        Json::Value list(Json::arrayValue);
        for (const auto& delta : clauses) {
            Json::Value entry(Json::objectValue);
            entry["clause"] = static_cast<Json::UInt>(delta.index + 1);
            entry["status"] = to_string(delta.status);
            if (delta.status != ClauseStatus::match) {
                if (delta.status != ClauseStatus::onlyInCandidate)
                    entry["baseline"] = delta.baseline;
                if (delta.status != ClauseStatus::onlyInBaseline)
                    entry["candidate"] = delta.candidate;
            }
            list.append(entry);
        }
        ret["clauses"] = list;
    }
    return ret;
}

ContractComparison compareContracts(
    const ContractDocument& baseline,
    const ContractDocument& candidate,
    beast::Journal j) {

    ContractComparison result;
    result.baselineRoot = baseline.root();
    result.candidateRoot = candidate.root();
    result.identical = sameRoot(result.baselineRoot, result.candidateRoot);

    JLOG(j.debug()) << baseline.name() << " vs " << candidate.name() << ": "
                    << (result.identical ? "identical" : "different");

    if (result.identical)
        return result;

    if (baseline.empty() || candidate.empty()) {
        JLOG(j.info()) << "Skipping clause-level comparison of "
                       << baseline.name() << " and " << candidate.name()
                       << ": empty clause list";
        return result;
    }

    result.clauseLevel = true;

    const auto& lhs = baseline.leaves();
    const auto& rhs = candidate.leaves();
    std::size_t const common = std::min(lhs.size(), rhs.size());
    std::size_t const total = std::max(lhs.size(), rhs.size());
    result.clauses.reserve(total);

    for (std::size_t i = 0; i < common; ++i) {
        ClauseDelta delta;
        delta.index = i;
        delta.status = lhs[i] == rhs[i] ? ClauseStatus::match : ClauseStatus::differ;
        delta.baseline = baseline.clauses()[i];
        delta.candidate = candidate.clauses()[i];
        result.clauses.push_back(std::move(delta));
    }

    for (std::size_t i = common; i < total; ++i) {
        ClauseDelta delta;
        delta.index = i;
        if (lhs.size() > rhs.size()) {
            delta.status = ClauseStatus::onlyInBaseline;
            delta.baseline = baseline.clauses()[i];
        } else {
            delta.status = ClauseStatus::onlyInCandidate;
            delta.candidate = candidate.clauses()[i];
        }
        result.clauses.push_back(std::move(delta));
    }

    JLOG(j.debug()) << result.differences() << " of " << total
                    << " clause positions differ";

    return result;
}

} // namespace cverify
