#pragma once

#include <libcverify/contract/ContractComparison.h>
#include <libcverify/contract/ContractDocument.h>
#include <libcverify/merkle/MerkleProof.h>
#include <string>

namespace cverify {

// Human-readable renderings used by the contract-verifier tool.

std::string describeComparison(
    const ContractDocument& baseline,
    const ContractDocument& candidate,
    const ContractComparison& comparison);

std::string describeWitness(
    const ContractDocument& document,
    const merkle::ClauseWitness& witness);

std::string describeVerification(
    const ContractDocument& document,
    bool verified);

/**
 * Side-by-side roots of two contracts, labelled with their names, and
 * whether they are identical.
 */
std::string verificationLog(
    const ContractDocument& first,
    const ContractDocument& second);

// First n characters of a digest followed by "...", for narration.
std::string abbreviate(const merkle::Digest& digest, std::size_t n = 10);

} // namespace cverify
