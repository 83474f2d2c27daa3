#pragma once

#include <libcverify/merkle/Digest.h>
#include <libcverify/merkle/MerkleProof.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace cverify {
namespace merkle {

/**
 * A built tree, leaves first. levels[0] is the leaf sequence and the last
 * level holds the root alone. A tree over zero leaves has zero levels.
 *
 * Each level has ceil(n / 2) entries where n is the size of the level below:
 * pairs are taken left to right and an unpaired last node is paired with a
 * copy of itself.
 */
using MerkleLevels = std::vector<std::vector<Digest>>;

MerkleLevels buildTree(const std::vector<Digest>& leaves);

// EMPTY_ROOT when the tree has no levels.
Digest rootOf(const MerkleLevels& tree);

/**
 * Authentication path for target, or no value when target is not a leaf of
 * the tree. A present leaf of a single-leaf tree yields an empty path.
 */
std::optional<MerkleProof> findProof(
    const MerkleLevels& tree,
    const Digest& target);

/**
 * Same walk as findProof, with "not found" reported as an empty proof.
 * Callers that need to tell a missing leaf from a single-leaf tree should
 * use findProof or check membership first.
 */
MerkleProof generateProof(const MerkleLevels& tree, const Digest& target);

/**
 * Immutable Merkle tree over the clauses of one document.
 * Rebuilt from scratch whenever the clause sequence changes.
 */
class ClauseMerkleTree {
public:
    ClauseMerkleTree() = default;
    explicit ClauseMerkleTree(const std::vector<Digest>& leaves);

    Digest root() const { return rootOf(levels_); }

    const MerkleLevels& levels() const { return levels_; }
    const std::vector<Digest>& leaves() const;

    std::size_t size() const { return leaves().size(); }
    bool empty() const { return levels_.empty(); }
    std::size_t depth() const { return levels_.size(); }

    bool contains(const Digest& leaf) const;

    std::optional<MerkleProof> proof(const Digest& leaf) const {
        return findProof(levels_, leaf);
    }

    // Witness for the leaf at position index, no value if out of range.
    std::optional<ClauseWitness> witness(std::size_t index) const;

private:
    MerkleLevels levels_;
};

} // namespace merkle
} // namespace cverify
