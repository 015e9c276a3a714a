#include <gtest/gtest.h>
#include "utilities/blockio.hpp"
#include "utilities/merkle_tree.hpp"

using namespace merkseal;

namespace {

std::vector<Digest> makeLeaves(size_t n) {
  std::vector<Digest> leaves;
  for (size_t i = 0; i < n; ++i)
    leaves.push_back(hashData("leaf-" + std::to_string(i)));
  return leaves;
}

} // namespace

TEST(MerkleProof, EveryLeafVerifies) {
  for (HashScheme scheme : {HashScheme::Legacy, HashScheme::DomainSeparated}) {
    for (size_t n : {1u, 2u, 3u, 5u, 8u}) {
      auto leaves = makeLeaves(n);
      MerkleTree tree(leaves, scheme);
      for (size_t i = 0; i < n; ++i) {
        auto proof = tree.proof(i);
        EXPECT_TRUE(
            MerkleTree::verifyProof(leaves[i], i, proof, tree.root(), scheme))
            << "n=" << n << " i=" << i;
      }
    }
  }
}

TEST(MerkleProof, RejectsWrongLeafOrPosition) {
  auto leaves = makeLeaves(5);
  MerkleTree tree(leaves);
  auto proof = tree.proof(2);
  EXPECT_FALSE(MerkleTree::verifyProof(leaves[3], 2, proof, tree.root()));
  EXPECT_FALSE(MerkleTree::verifyProof(leaves[2], 3, proof, tree.root()));
  // Index beyond the proof depth
  EXPECT_FALSE(MerkleTree::verifyProof(leaves[2], 2 + 8, proof, tree.root()));
  proof.pop_back();
  EXPECT_FALSE(MerkleTree::verifyProof(leaves[2], 2, proof, tree.root()));
}

TEST(MerkleProof, OutOfRangeIndexThrows) {
  MerkleTree tree(makeLeaves(3));
  EXPECT_THROW(tree.proof(3), std::out_of_range);
  EXPECT_TRUE(MerkleTree(makeLeaves(1)).proof(0).empty());
}
