#pragma once

#include <libcverify/merkle/MerkleTree.h>
#include <xrpl/beast/utility/Journal.h>
#include <boost/filesystem/path.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cverify {

/**
 * One version of a contract: its clauses, their leaf digests and the
 * Merkle tree built over them. Immutable once constructed.
 */
class ContractDocument {
public:
    ContractDocument() = default;

    ContractDocument(
        std::string name,
        std::vector<std::string> clauses,
        beast::Journal j);

    static ContractDocument fromText(
        std::string name,
        std::string_view text,
        beast::Journal j);

    // Throws std::runtime_error if the file cannot be read.
    static ContractDocument fromFile(
        const boost::filesystem::path& path,
        beast::Journal j);

    const std::string& name() const { return name_; }
    const std::vector<std::string>& clauses() const { return clauses_; }
    const std::vector<merkle::Digest>& leaves() const { return tree_.leaves(); }
    const merkle::ClauseMerkleTree& tree() const { return tree_; }
    merkle::Digest root() const { return tree_.root(); }

    std::size_t size() const { return clauses_.size(); }
    bool empty() const { return clauses_.empty(); }

    bool contains(const merkle::Digest& leaf) const { return tree_.contains(leaf); }

    // Membership witness for the clause at 0-based position index.
    std::optional<merkle::ClauseWitness> witness(std::size_t index) const {
        return tree_.witness(index);
    }

private:
    std::string name_;
    std::vector<std::string> clauses_;
    merkle::ClauseMerkleTree tree_;
};

} // namespace cverify
