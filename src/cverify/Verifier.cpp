#include "Verifier.h"
#include <cverify/Report.h>
#include <libcverify/contract/ContractComparison.h>
#include <CLI/CLI.hpp>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>

namespace cverify {

Verifier::Verifier(
    const VerifierConfig& config,
    ripple::Logs& logs,
    std::ostream& out,
    std::ostream& err)
    : config_(config)
    , out_(out)
    , err_(err)
    , jDoc_(logs.journal("ContractDocument"))
    , jCmp_(logs.journal("Comparison"))
    , j_(logs.journal("Verifier")) {
}

std::vector<ContractDocument> Verifier::load(
    const std::vector<boost::filesystem::path>& files) const {
    std::vector<ContractDocument> documents;
    documents.reserve(files.size());
    for (const auto& file : files)
        documents.push_back(ContractDocument::fromFile(file, jDoc_));
    return documents;
}

int Verifier::run(const std::vector<ContractDocument>& documents) const {
    if (documents.size() < 2) {
        err_ << "contract-verifier: need a baseline and at least one "
                "candidate contract\n";
        return exitUsage;
    }

    const auto& baseline = documents.front();

    Json::Value result(Json::objectValue);
    Json::Value roots(Json::objectValue);
    Json::Value comparisons(Json::arrayValue);

    if (!json())
        out_ << "--- Overall Contract Comparison (using Merkle Root) ---\n";
    for (const auto& doc : documents) {
        roots[doc.name()] = doc.root();
        if (!json())
            out_ << doc.name() << " Root: " << doc.root() << '\n';
    }

    for (std::size_t i = 1; i < documents.size(); ++i) {
        auto const comparison = compareContracts(baseline, documents[i], jCmp_);
        if (json())
            comparisons.append(comparison.getJson());
        else
            out_ << '\n'
                 << describeComparison(baseline, documents[i], comparison);
    }

    if (!json())
        out_ << "\n\n--- Merkle Proof Demonstration ---\n";

    std::optional<merkle::ClauseWitness> witness;
    if (config_.proveClause != 0)
        witness = baseline.witness(config_.proveClause - 1);
    if (!witness) {
        JLOG(j_.error()) << "Clause " << config_.proveClause << " not in "
                         << baseline.name() << " (" << baseline.size()
                         << " clauses)";
        err_ << "contract-verifier: cannot prove clause "
             << config_.proveClause << " of " << baseline.name()
             << ": not enough clauses\n";
        return exitUsage;
    }

    auto const status = verifyWitness(*witness, documents, result);

    if (json()) {
        result["roots"] = roots;
        result["comparisons"] = comparisons;
        out_ << result.toStyledString();
    } else {
        out_ << '\n' << verificationLog(baseline, documents[1]);
    }

    return status;
}

int Verifier::verifyWitness(
    const merkle::ClauseWitness& witness,
    const std::vector<ContractDocument>& documents,
    Json::Value& result) const {
    const auto& baseline = documents.front();
    auto const clause = witness.index + 1;

    bool const selfVerified = witness.verify(baseline.root());
    if (!selfVerified) {
        JLOG(j_.fatal()) << "Proof for clause " << clause << " of "
                         << baseline.name()
                         << " does not verify against its own root";
    }

    Json::Value verification(Json::arrayValue);
    if (json())
        result["proof"] = witness.getJson();
    else
        out_ << '\n' << describeWitness(baseline, witness);

    for (const auto& doc : documents) {
        bool const ok = witness.verify(doc.root());
        JLOG(j_.debug()) << "Clause " << clause << " of " << baseline.name()
                         << " against " << doc.name() << ": "
                         << (ok ? "verified" : "rejected");
        if (json()) {
            Json::Value entry(Json::objectValue);
            entry["contract"] = doc.name();
            entry["root"] = doc.root();
            entry["verified"] = ok;
            verification.append(entry);
        } else {
            out_ << describeVerification(doc, ok);
        }
    }

    if (json())
        result["verification"] = verification;

    return selfVerified ? exitSuccess : exitUnverified;
}

int runVerifier(
    int argc,
    const char* const* argv,
    std::ostream& out,
    std::ostream& err) {
    CLI::App cli{
        "Compares contract versions by Merkle root, reports clause "
        "differences, and proves one baseline clause against every "
        "version's root.",
        "contract-verifier"};

    std::vector<std::string> files;
    std::optional<std::string> confFile;
    std::optional<std::size_t> proveClause;
    std::optional<std::string> logLevel;
    bool json = false;
    bool quiet = false;

    cli.add_option(
           "contracts",
           files,
           "Baseline contract followed by one or more candidates")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--conf", confFile, "configuration file")
        ->check(CLI::ExistingFile);
    cli.add_option(
           "--prove", proveClause, "1-based clause of the baseline to prove")
        ->check(CLI::PositiveNumber);
    cli.add_option(
        "--log-level",
        logLevel,
        "trace, debug, info, warning, error or fatal");
    cli.add_flag("--json", json, "emit JSON instead of text");
    cli.add_flag("-q,--quiet", quiet, "silence log output on the console");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help exits cleanly, every other parse error is a usage error
        return cli.exit(e, out, err) == 0 ? exitSuccess : exitUsage;
    }

    try {
        VerifierConfig config;
        if (confFile)
            config.load(VerifierConfig::parseFile(*confFile));
        if (proveClause)
            config.proveClause = *proveClause;
        if (json)
            config.output = OutputFormat::json;
        if (quiet)
            config.quiet = true;
        if (logLevel)
            config.logLevel = parseSeverity(*logLevel);

        ripple::Logs logs(config.logLevel);
        logs.silent(config.quiet);

        Verifier verifier(config, logs, out, err);
        std::vector<boost::filesystem::path> const paths(
            files.begin(), files.end());
        return verifier.run(verifier.load(paths));
    } catch (const std::exception& e) {
        err << "contract-verifier: " << e.what() << '\n';
        return exitUsage;
    }
}

} // namespace cverify
