#include "MerkleProof.h"

namespace cverify {
namespace merkle {

std::string to_string(Side side) {
    return side == Side::left ? "left" : "right";
}

bool verifyProof(
    const MerkleProof& proof,
    const Digest& target,
    const Digest& expectedRoot) {

    Digest computed = target;

    for (const auto& step : proof) {
        if (step.side == Side::left) {
            // Sibling is on the left, computed is the right child
            computed = hashChildren(step.sibling, computed);
        } else {
            computed = hashChildren(computed, step.sibling);
        }
    }

    return computed == expectedRoot;
}

Json::Value getJson(const MerkleProof& proof) {
    Json::Value steps(Json::arrayValue);
    for (const auto& step : proof) {
        Json::Value entry(Json::objectValue);
        entry["sibling"] = step.sibling;
        entry["side"] = to_string(step.side);
        steps.append(entry);
    }
    return steps;
}

bool ClauseWitness::verify() const {
    return verifyProof(path, leaf, root);
}

bool ClauseWitness::verify(const Digest& otherRoot) const {
    return verifyProof(path, leaf, otherRoot);
}

Json::Value ClauseWitness::getJson() const {
    Json::Value ret(Json::objectValue);
    ret["index"] = static_cast<Json::UInt>(index);
    ret["leaf"] = leaf;
    ret["root"] = root;
    ret["path"] = merkle::getJson(path);
    return ret;
}

} // namespace merkle
} // namespace cverify
