#include "Digest.h"
#include <xrpl/basics/base_uint.h>
#include <boost/algorithm/hex.hpp>
#include <openssl/sha.h>
#include <iterator>

namespace cverify {
namespace merkle {

Digest hashData(std::string_view data) {
    ripple::uint256 result;
    SHA256(
        reinterpret_cast<const unsigned char*>(data.data()),
        data.size(),
        result.data());

    Digest hex;
    hex.reserve(DIGEST_HEX_SIZE);
    boost::algorithm::hex_lower(
        result.begin(), result.end(), std::back_inserter(hex));
    return hex;
}

Digest hashChildren(const Digest& left, const Digest& right) {
    std::string input;
    input.reserve(left.size() + right.size());
    input.append(left);
    input.append(right);
    return hashData(input);
}

} // namespace merkle
} // namespace cverify
