#include <xrpl/beast/unit_test.h>
#include <libcverify/contract/ClauseExtractor.h>
#include <libcverify/contract/ContractDocument.h>
#include <test/contract/ContractFixtures.h>
#include <boost/filesystem.hpp>
#include <fstream>
#include <stdexcept>
#include <string>

namespace cverify {

class ContractDocument_test : public beast::unit_test::suite
{
private:
    beast::Journal const j_{beast::Journal::getNullSink()};

public:
    void run() override
    {
        testFromText();
        testEmptyDocument();
        testWitness();
        testFromFile();
        testMissingFile();
    }

    void testFromText()
    {
        testcase("FromText");

        auto const doc = ContractDocument::fromText("v1", test::contractV1, j_);
        BEAST_EXPECT(doc.name() == "v1");
        BEAST_EXPECT(doc.size() == 3);
        BEAST_EXPECT(doc.leaves() == hashClauses(doc.clauses()));
        BEAST_EXPECT(
            doc.root() == merkle::rootOf(merkle::buildTree(doc.leaves())));
        BEAST_EXPECT(doc.contains(merkle::hashData(
            "Clause 2: The seller provides a 1-year warranty.")));
        BEAST_EXPECT(!doc.contains(merkle::hashData(
            "Clause 2: The seller provides a 2-year warranty.")));

        auto const same = ContractDocument::fromText("v3", test::contractV3, j_);
        BEAST_EXPECT(same.root() == doc.root());
    }

    void testEmptyDocument()
    {
        testcase("EmptyDocument");

        auto const doc = ContractDocument::fromText("blank", "\n \n", j_);
        BEAST_EXPECT(doc.empty());
        BEAST_EXPECT(doc.root() == merkle::EMPTY_ROOT);
        BEAST_EXPECT(!doc.witness(0));

        ContractDocument const defaulted;
        BEAST_EXPECT(defaulted.empty());
        BEAST_EXPECT(defaulted.root() == merkle::EMPTY_ROOT);
    }

    void testWitness()
    {
        testcase("Witness");

        auto const v1 = ContractDocument::fromText("v1", test::contractV1, j_);
        auto const v2 = ContractDocument::fromText("v2", test::contractV2, j_);

        auto const w1 = v1.witness(1);
        auto const w2 = v2.witness(1);
        BEAST_EXPECT(w1 && w2);
        if (!w1 || !w2)
            return;

        BEAST_EXPECT(w1->verify());
        BEAST_EXPECT(w2->verify());
        BEAST_EXPECT(!w1->verify(v2.root()));
        BEAST_EXPECT(!w2->verify(v1.root()));
        BEAST_EXPECT(w1->path != w2->path);

        BEAST_EXPECT(!v1.witness(3));
    }

    void testFromFile()
    {
        testcase("FromFile");

        namespace fs = boost::filesystem;
        auto const path =
            fs::temp_directory_path() / fs::unique_path("contract-%%%%-%%%%.txt");
        {
            std::ofstream out(path.string());
            out << test::contractV4;
        }

        auto const doc = ContractDocument::fromFile(path, j_);
        BEAST_EXPECT(doc.name() == path.filename().string());
        BEAST_EXPECT(doc.size() == 4);
        BEAST_EXPECT(
            doc.root() ==
            ContractDocument::fromText("v4", test::contractV4, j_).root());

        boost::system::error_code ec;
        fs::remove(path, ec);
    }

    void testMissingFile()
    {
        testcase("MissingFile");

        auto const path = boost::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("missing-%%%%-%%%%.txt");
        except<std::runtime_error>(
            [&] { ContractDocument::fromFile(path, j_); });
    }
};

BEAST_DEFINE_TESTSUITE(ContractDocument, contract, cverify);

}  // namespace cverify
