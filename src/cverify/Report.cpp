#include "Report.h"
#include <sstream>

namespace cverify {

std::string abbreviate(const merkle::Digest& digest, std::size_t n) {
    if (digest.size() <= n)
        return digest;
    return digest.substr(0, n) + "...";
}

std::string describeComparison(
    const ContractDocument& baseline,
    const ContractDocument& candidate,
    const ContractComparison& comparison) {
    std::ostringstream out;
    out << baseline.name() << " vs " << candidate.name() << ": "
        << (comparison.identical ? "Identical" : "Different") << '\n';

    if (comparison.identical)
        return out.str();

    if (!comparison.clauseLevel) {
        out << "Cannot perform clause-level comparison due to empty clause lists.\n";
        return out.str();
    }

    out << "\nClause-Level Comparison:\n";

    bool extraHeader = false;
    for (const auto& delta : comparison.clauses) {
        auto const number = delta.index + 1;
        switch (delta.status) {
            case ClauseStatus::match:
                out << "Clause " << number << ": Match\n";
                break;
            case ClauseStatus::differ:
                out << "Clause " << number << ": Difference\n"
                    << "   " << baseline.name() << ": " << delta.baseline << '\n'
                    << "   " << candidate.name() << ": " << delta.candidate << '\n';
                break;
            case ClauseStatus::onlyInBaseline:
            case ClauseStatus::onlyInCandidate: {
                bool const inBaseline =
                    delta.status == ClauseStatus::onlyInBaseline;
                if (!extraHeader) {
                    out << "\nAdditional Clauses:\n"
                        << "   " << (inBaseline ? baseline.name() : candidate.name())
                        << " has additional clauses:\n";
                    extraHeader = true;
                }
                out << "      Clause " << number << ": "
                    << (inBaseline ? delta.baseline : delta.candidate) << '\n';
                break;
            }
        }
    }

    return out.str();
}

std::string describeWitness(
    const ContractDocument& document,
    const merkle::ClauseWitness& witness) {
    std::ostringstream out;
    out << "Proof for clause " << witness.index + 1 << " of "
        << document.name() << ": '" << document.clauses()[witness.index]
        << "'\n";
    out << "  Leaf: " << witness.leaf << '\n';

    if (witness.path.empty())
        out << "  (single clause, the leaf is the root)\n";

    std::size_t level = 0;
    for (const auto& step : witness.path)
        out << "  Level " << level++ << ": " << step.sibling << " ("
            << to_string(step.side) << ")\n";
    return out.str();
}

std::string describeVerification(
    const ContractDocument& document,
    bool verified) {
    std::ostringstream out;
    out << "Verification against " << document.name() << " root ("
        << abbreviate(document.root()) << "): "
        << (verified ? "PASSED" : "FAILED") << '\n';
    return out.str();
}

std::string verificationLog(
    const ContractDocument& first,
    const ContractDocument& second) {
    std::ostringstream out;
    out << "[Verification Log]\n"
        << "Root " << first.name() << ": " << first.root() << '\n'
        << "Root " << second.name() << ": " << second.root() << '\n'
        << "Status: "
        << (sameRoot(first.root(), second.root()) ? "Identical" : "Different")
        << '\n';
    return out.str();
}

} // namespace cverify
