#pragma once

#include <cverify/VerifierConfig.h>
#include <libcverify/contract/ContractDocument.h>
#include <libcverify/merkle/MerkleProof.h>
#include <xrpl/basics/Log.h>
#include <xrpl/json/json_value.h>
#include <boost/filesystem/path.hpp>
#include <ostream>
#include <vector>

namespace cverify {

enum ExitCode { exitSuccess = 0, exitUsage = 1, exitUnverified = 2 };

/**
 * The contract-verifier workflow over already parsed settings.
 *
 * Compares the first (baseline) contract against every other one, proves
 * the configured baseline clause and verifies that proof against each
 * contract's root. Reports go to out, problems to err.
 */
class Verifier {
public:
    Verifier(
        const VerifierConfig& config,
        ripple::Logs& logs,
        std::ostream& out,
        std::ostream& err);

    // Throws std::runtime_error if a file cannot be read.
    std::vector<ContractDocument> load(
        const std::vector<boost::filesystem::path>& files) const;

    int run(const std::vector<ContractDocument>& documents) const;

    /**
     * Prints the witness and checks it against the root of every document.
     * Returns exitUnverified when it fails against the baseline root.
     * In JSON mode the results are added to result instead of printed.
     */
    int verifyWitness(
        const merkle::ClauseWitness& witness,
        const std::vector<ContractDocument>& documents,
        Json::Value& result) const;

private:
    bool json() const { return config_.output == OutputFormat::json; }

    VerifierConfig const config_;
    std::ostream& out_;
    std::ostream& err_;
    beast::Journal const jDoc_;
    beast::Journal const jCmp_;
    beast::Journal const j_;
};

/**
 * Entry point of the contract-verifier tool: parses the command line,
 * merges it over the optional configuration file and runs the Verifier.
 * Errors are reported on err and turned into exit codes.
 */
int runVerifier(
    int argc,
    const char* const* argv,
    std::ostream& out,
    std::ostream& err);

} // namespace cverify
