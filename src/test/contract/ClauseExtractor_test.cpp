#include <xrpl/beast/unit_test.h>
#include <libcverify/contract/ClauseExtractor.h>
#include <string>
#include <vector>

namespace cverify {

class ClauseExtractor_test : public beast::unit_test::suite
{
public:
    void run() override
    {
        testBlankLines();
        testFormattingPreserved();
        testLineEndings();
        testEmptyText();
        testHashClauses();
    }

    void testBlankLines()
    {
        testcase("BlankLines");

        auto const clauses = extractClauses(
            "\n"
            "Clause 1: The buyer agrees to pay in full within 30 days.\n"
            "\n"
            "   \t \n"
            "Clause 2: The seller provides a 1-year warranty.\n"
            "Clause 3: All disputes will be settled in California.\n"
            "\n");

        std::vector<std::string> const expected{
            "Clause 1: The buyer agrees to pay in full within 30 days.",
            "Clause 2: The seller provides a 1-year warranty.",
            "Clause 3: All disputes will be settled in California."};
        BEAST_EXPECT(clauses == expected);
    }

    void testFormattingPreserved()
    {
        testcase("FormattingPreserved");

        auto const clauses =
            extractClauses("First\n    indented  clause  \nLast .");
        BEAST_EXPECT(clauses.size() == 3);
        if (clauses.size() != 3)
            return;
        BEAST_EXPECT(clauses[0] == "First");
        BEAST_EXPECT(clauses[1] == "    indented  clause  ");
        BEAST_EXPECT(clauses[2] == "Last .");
    }

    void testLineEndings()
    {
        testcase("LineEndings");

        auto const lf = extractClauses("A\nB\n");
        auto const crlf = extractClauses("A\r\nB\r\n");
        BEAST_EXPECT(lf == crlf);
        BEAST_EXPECT(crlf == (std::vector<std::string>{"A", "B"}));
    }

    void testEmptyText()
    {
        testcase("EmptyText");

        BEAST_EXPECT(extractClauses("").empty());
        BEAST_EXPECT(extractClauses(" \n\t\n  ").empty());
    }

    void testHashClauses()
    {
        testcase("HashClauses");

        std::vector<std::string> const clauses{"B", "A", "B"};
        auto const leaves = hashClauses(clauses);
        BEAST_EXPECT(leaves.size() == 3);
        if (leaves.size() != 3)
            return;
        // Order and duplicates are kept
        BEAST_EXPECT(leaves[0] == merkle::hashData("B"));
        BEAST_EXPECT(leaves[1] == merkle::hashData("A"));
        BEAST_EXPECT(leaves[2] == leaves[0]);
        BEAST_EXPECT(hashClauses({}).empty());
    }
};

BEAST_DEFINE_TESTSUITE(ClauseExtractor, contract, cverify);

}  // namespace cverify
