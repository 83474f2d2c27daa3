#include "VerifierConfig.h"
#include <xrpl/basics/FileUtilities.h>
#include <xrpl/basics/Log.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/system/error_code.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cverify {

beast::severities::Severity parseSeverity(const std::string& name) {
    auto const level = ripple::Logs::fromString(name);
    if (level == ripple::lsINVALID)
        throw std::invalid_argument("Invalid log level: " + name);
    return ripple::Logs::toSeverity(level);
}

OutputFormat parseOutputFormat(const std::string& name) {
    if (boost::iequals(name, "text"))
        return OutputFormat::text;
    if (boost::iequals(name, "json"))
        return OutputFormat::json;
    throw std::invalid_argument("Invalid output format: " + name);
}

void VerifierConfig::load(const ripple::Section& section) {
    if (auto const level = section.get("log_level"))
        logLevel = parseSeverity(*level);

    // Section::get<std::size_t> wraps "-1" around to SIZE_MAX, so only plain
    // decimal digits are accepted.
    if (auto const clause = section.get("prove_clause")) {
        std::size_t value = 0;
        bool const digits = !clause->empty() &&
            std::all_of(clause->begin(), clause->end(), [](unsigned char c) {
                return std::isdigit(c) != 0;
            });
        if (!digits || !ripple::set(value, "prove_clause", section) ||
            value == 0)
            throw std::invalid_argument("Invalid prove_clause: " + *clause);
        proveClause = value;
    }

    if (auto const format = section.get("output"))
        output = parseOutputFormat(*format);
}

ripple::Section VerifierConfig::parse(std::string_view text) {
    std::string const body(text);
    std::vector<std::string> raw;
    boost::algorithm::split(
        raw, body, boost::algorithm::is_any_of("\r\n"));

    std::vector<std::string> lines;
    lines.reserve(raw.size());
    for (auto& line : raw) {
        boost::algorithm::trim(line);
        if (line.empty() || line.front() == '#')
            continue;
        lines.push_back(std::move(line));
    }

    ripple::Section section(SECTION);
    section.append(lines);
    return section;
}

ripple::Section VerifierConfig::parseFile(const boost::filesystem::path& path) {
    boost::system::error_code ec;
    auto const text = ripple::getFileContents(ec, path);
    if (ec)
        throw std::runtime_error(
            "Unable to read config " + path.string() + ": " + ec.message());
    return parse(text);
}

} // namespace cverify
