#pragma once

#include <libcverify/merkle/Digest.h>
#include <xrpl/json/json_value.h>
#include <string>
#include <utility>
#include <vector>

namespace cverify {
namespace merkle {

// Position of a sibling relative to the node being authenticated.
enum class Side { left, right };

std::string to_string(Side side);

struct ProofStep {
    Digest sibling;
    Side side = Side::left;

    ProofStep() = default;
    ProofStep(Digest sib, Side s) : sibling(std::move(sib)), side(s) {}

    bool operator==(const ProofStep& other) const {
        return sibling == other.sibling && side == other.side;
    }
    bool operator!=(const ProofStep& other) const { return !(*this == other); }
};

/**
 * Authentication path from a leaf to the root, bottom level first.
 */
using MerkleProof = std::vector<ProofStep>;

/**
 * Recompute the root from target by folding in each sibling on its side,
 * and compare with expectedRoot.
 *
 * An empty proof verifies exactly when target == expectedRoot (single-leaf
 * tree).
 */
bool verifyProof(
    const MerkleProof& proof,
    const Digest& target,
    const Digest& expectedRoot);

Json::Value getJson(const MerkleProof& proof);

/**
 * Witness for clause membership: the leaf, its path and the root it claims.
 */
struct ClauseWitness {
    std::size_t index = 0;
    Digest leaf;
    MerkleProof path;
    Digest root;

    bool verify() const;
    // Check the path against a root other than the one recorded.
    bool verify(const Digest& otherRoot) const;

    Json::Value getJson() const;
};

} // namespace merkle
} // namespace cverify
