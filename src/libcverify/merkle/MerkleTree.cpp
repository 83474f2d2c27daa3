#include "MerkleTree.h"
#include <algorithm>
#include <utility>

namespace cverify {
namespace merkle {

namespace {

// Children of the parent at position i / 2. The right child of an unpaired
// last node is the node itself.
std::pair<const Digest&, const Digest&>
childrenAt(const std::vector<Digest>& level, std::size_t i) {
    const Digest& left = level[i];
    const Digest& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
    return {left, right};
}

} // namespace

MerkleLevels buildTree(const std::vector<Digest>& leaves) {
    MerkleLevels tree;
    if (leaves.empty())
        return tree;

    tree.push_back(leaves);

    while (tree.back().size() > 1) {
        const auto& level = tree.back();

        std::vector<Digest> next;
        next.reserve((level.size() + 1) / 2);

        for (std::size_t i = 0; i < level.size(); i += 2) {
            auto [left, right] = childrenAt(level, i);
            next.push_back(hashChildren(left, right));
        }

        tree.push_back(std::move(next));
    }

    return tree;
}

Digest rootOf(const MerkleLevels& tree) {
    if (tree.empty() || tree.back().empty())
        return EMPTY_ROOT;
    return tree.back().front();
}

std::optional<MerkleProof> findProof(
    const MerkleLevels& tree,
    const Digest& target) {

    if (tree.empty() || tree.front().empty())
        return std::nullopt;

    MerkleProof proof;
    proof.reserve(tree.size() - 1);

    Digest current = target;

    // Every level below the root contributes one sibling
    for (std::size_t level = 0; level + 1 < tree.size(); ++level) {
        const auto& nodes = tree[level];
        bool found = false;

        for (std::size_t i = 0; i < nodes.size(); i += 2) {
            auto [left, right] = childrenAt(nodes, i);

            if (current == left) {
                proof.emplace_back(right, Side::right);
            } else if (current == right) {
                proof.emplace_back(left, Side::left);
            } else {
                continue;
            }

            current = hashChildren(left, right);
            found = true;
            break;
        }

        if (!found)
            return std::nullopt;
    }

    // A single-leaf tree has no levels to climb; the target must be the leaf
    if (tree.size() == 1 && tree.front().front() != target)
        return std::nullopt;

    return proof;
}

MerkleProof generateProof(const MerkleLevels& tree, const Digest& target) {
    if (auto proof = findProof(tree, target))
        return std::move(*proof);
    return {};
}

ClauseMerkleTree::ClauseMerkleTree(const std::vector<Digest>& leaves)
    : levels_(buildTree(leaves)) {
}

const std::vector<Digest>& ClauseMerkleTree::leaves() const {
    static std::vector<Digest> const none;
    return levels_.empty() ? none : levels_.front();
}

bool ClauseMerkleTree::contains(const Digest& leaf) const {
    const auto& l = leaves();
    return std::find(l.begin(), l.end(), leaf) != l.end();
}

std::optional<ClauseWitness> ClauseMerkleTree::witness(std::size_t index) const {
    if (index >= size())
        return std::nullopt;

    ClauseWitness w;
    w.index = index;
    w.leaf = leaves()[index];
    w.root = root();

    auto path = proof(w.leaf);
    if (!path)
        return std::nullopt;
    w.path = std::move(*path);

    return w;
}

} // namespace merkle
} // namespace cverify
