#include "ContentVerifier.hpp"
#include "TestTree.hpp"

namespace drivesage {
namespace {

class ContentVerifierTest : public test::TestTree {};

TEST_F(ContentVerifierTest, HashesKnownContent) {
  auto file = writeFile("abc.txt", std::string("abc"));

  ContentVerifier verifier;
  auto hash = verifier.hashFile(file.string());

  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ(*hash,
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ContentVerifierTest, MissingFileHasNoHash) {
  ContentVerifier verifier;
  EXPECT_FALSE(verifier.hashFile((root / "missing.bin").string()).has_value());
}

TEST_F(ContentVerifierTest, KeepsOnlyCandidatesWithEqualContent) {
  auto a1 = writeFile("a/pic.png", std::string("same-bytes"));
  auto a2 = writeFile("b/pic.png", std::string("same-bytes"));
  auto b1 = writeFile("a/doc.txt", std::string("first"));
  auto b2 = writeFile("b/doc.txt", std::string("other"));

  std::vector<DuplicateRecord> candidates = {
      {a1.string(), a2.string(), "b/pic.png", 10, 0},
      {b1.string(), b2.string(), "b/doc.txt", 5, 0},
      {a1.string(), (root / "gone.png").string(), "gone.png", 10, 0}};

  ContentVerifier verifier;
  auto confirmed = verifier.verify(candidates);

  ASSERT_EQ(confirmed.size(), 1u);
  EXPECT_EQ(confirmed[0].duplicate, a2.string());
}

} // namespace
} // namespace drivesage
