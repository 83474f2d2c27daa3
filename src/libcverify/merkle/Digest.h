#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cverify {
namespace merkle {

/**
 * Lowercase hex SHA-256 digest (64 characters).
 * Digests are opaque and only ever compared for equality.
 */
using Digest = std::string;

// Root reported for a tree built from zero leaves. Not valid hex, so it can
// never equal a real digest.
constexpr char EMPTY_ROOT[] = "EMPTY_CONTRACT";

constexpr std::size_t DIGEST_HEX_SIZE = 64;

/**
 * SHA-256 over the bytes of data, rendered as lowercase hex.
 */
Digest hashData(std::string_view data);

/**
 * Parent of two nodes: hashData(left + right) over the hex text of both
 * children, left first.
 */
Digest hashChildren(const Digest& left, const Digest& right);

} // namespace merkle
} // namespace cverify
