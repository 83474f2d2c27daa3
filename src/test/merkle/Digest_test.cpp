#include <xrpl/beast/unit_test.h>
#include <libcverify/merkle/Digest.h>
#include <string>

namespace cverify {

class Digest_test : public beast::unit_test::suite
{
public:
    void run() override
    {
        testKnownVectors();
        testFormat();
        testDeterminism();
        testHashChildren();
    }

    void testKnownVectors()
    {
        testcase("KnownVectors");

        BEAST_EXPECT(
            merkle::hashData("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        BEAST_EXPECT(
            merkle::hashData("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        BEAST_EXPECT(
            merkle::hashData("The quick brown fox jumps over the lazy dog") ==
            "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
    }

    void testFormat()
    {
        testcase("Format");

        auto const d = merkle::hashData("Clause 1: The buyer agrees to pay.");
        BEAST_EXPECT(d.size() == merkle::DIGEST_HEX_SIZE);
        for (char c : d)
            BEAST_EXPECT((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }

    void testDeterminism()
    {
        testcase("Determinism");

        std::string const clause = "All disputes will be settled in California.";
        BEAST_EXPECT(merkle::hashData(clause) == merkle::hashData(clause));
        BEAST_EXPECT(
            merkle::hashData(clause) !=
            merkle::hashData("All disputes will be settled in California ."));

        // Bytes are hashed as given, no normalisation of spacing or case
        BEAST_EXPECT(merkle::hashData("a") != merkle::hashData("A"));
        BEAST_EXPECT(merkle::hashData("a") != merkle::hashData(" a"));
    }

    void testHashChildren()
    {
        testcase("HashChildren");

        auto const a = merkle::hashData("A");
        auto const b = merkle::hashData("B");

        // Parents hash the hex text of both children, left first
        BEAST_EXPECT(merkle::hashChildren(a, b) == merkle::hashData(a + b));
        BEAST_EXPECT(merkle::hashChildren(a, b) != merkle::hashChildren(b, a));
        BEAST_EXPECT(merkle::hashChildren(a, a) == merkle::hashData(a + a));
    }
};

BEAST_DEFINE_TESTSUITE(Digest, merkle, cverify);

}  // namespace cverify
