#pragma once

#include <xrpl/basics/BasicConfig.h>
#include <xrpl/beast/utility/Journal.h>
#include <boost/filesystem/path.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace cverify {

enum class OutputFormat { text, json };

/**
 * Settings for the contract-verifier tool.
 *
 * Read from a file of "key = value" lines. Recognised keys:
 *
 *   log_level      trace | debug | info | warning | error | fatal
 *   prove_clause   1-based clause of the baseline contract to prove
 *   output         text | json
 */
struct VerifierConfig {
    static constexpr const char* SECTION = "contract_verifier";

    beast::severities::Severity logLevel = beast::severities::kWarning;
    std::size_t proveClause = 2;
    OutputFormat output = OutputFormat::text;
    bool quiet = false;

    // Throws std::invalid_argument on a malformed value.
    void load(const ripple::Section& section);

    static ripple::Section parse(std::string_view text);

    // Throws std::runtime_error if the file cannot be read.
    static ripple::Section parseFile(const boost::filesystem::path& path);
};

beast::severities::Severity parseSeverity(const std::string& name);

OutputFormat parseOutputFormat(const std::string& name);

} // namespace cverify
