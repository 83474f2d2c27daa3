#include "ContractDocument.h"
#include <libcverify/contract/ClauseExtractor.h>
#include <xrpl/basics/FileUtilities.h>
#include <xrpl/basics/Log.h>
#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <utility>

namespace cverify {

ContractDocument::ContractDocument(
    std::string name,
    std::vector<std::string> clauses,
    beast::Journal j)
    : name_(std::move(name))
    , clauses_(std::move(clauses))
    , tree_(hashClauses(clauses_)) {
    JLOG(j.debug()) << "Built contract '" << name_ << "': "
                    << clauses_.size() << " clauses, "
                    << tree_.depth() << " levels, root " << tree_.root();
    if (clauses_.empty())
        JLOG(j.warn()) << "Contract '" << name_ << "' has no clauses";
}

ContractDocument ContractDocument::fromText(
    std::string name,
    std::string_view text,
    beast::Journal j) {
    return ContractDocument(std::move(name), extractClauses(text), j);
}

ContractDocument ContractDocument::fromFile(
    const boost::filesystem::path& path,
    beast::Journal j) {
    boost::system::error_code ec;
    std::string const text = ripple::getFileContents(ec, path);
    if (ec) {
        JLOG(j.error()) << "Unable to read contract " << path.string()
                        << ": " << ec.message();
        throw std::runtime_error(
            "Unable to read contract " + path.string() + ": " + ec.message());
    }

    JLOG(j.trace()) << "Read " << text.size() << " bytes from "
                    << path.string();
    return fromText(path.filename().string(), text, j);
}

} // namespace cverify
