#pragma once

#include <libcverify/merkle/Digest.h>
#include <string>
#include <string_view>
#include <vector>

namespace cverify {

/**
 * Split contract text into clauses, one per non-blank line.
 *
 * The text as a whole is trimmed, then split on '\n'. A trailing '\r' is
 * dropped from each line. Lines holding only whitespace are skipped; all
 * other lines are kept as written, in order.
 */
std::vector<std::string> extractClauses(std::string_view text);

// Leaf digests for a clause sequence, in the same order.
std::vector<merkle::Digest> hashClauses(const std::vector<std::string>& clauses);

} // namespace cverify
