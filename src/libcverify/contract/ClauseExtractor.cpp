#include "ClauseExtractor.h"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <utility>

namespace cverify {

std::vector<std::string> extractClauses(std::string_view text) {
    std::string const body = boost::algorithm::trim_copy(std::string(text));

    std::vector<std::string> lines;
    if (body.empty())
        return lines;
    boost::algorithm::split(lines, body, boost::algorithm::is_any_of("\n"));

    std::vector<std::string> clauses;
    clauses.reserve(lines.size());

    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        bool const blank = std::all_of(line.begin(), line.end(), [](char c) {
            return boost::algorithm::is_space()(c);
        });
        if (!blank)
            clauses.push_back(std::move(line));
    }

    return clauses;
}

std::vector<merkle::Digest> hashClauses(const std::vector<std::string>& clauses) {
    std::vector<merkle::Digest> leaves;
    leaves.reserve(clauses.size());
    for (const auto& clause : clauses)
        leaves.push_back(merkle::hashData(clause));
    return leaves;
}

} // namespace cverify
