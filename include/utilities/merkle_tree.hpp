#ifndef MERKSEAL_MERKLE_TREE_HPP
#define MERKSEAL_MERKLE_TREE_HPP

#include "utilities/digest.hpp"
#include <string>
#include <vector>

namespace merkseal {

/**
 * @brief How leaves, padding and internal nodes are hashed.
 *
 * Legacy reproduces every root already anchored: padding with the zero
 * digest and internal nodes as H(left || right). Two known weaknesses
 * follow from it. A real leaf equal to the zero digest cannot be told
 * apart from padding, and a two-leaf root equals the hash of a single
 * file holding both digests.
 *
 * DomainSeparated closes both: leaves become H(0x00 || leaf), internal
 * nodes H(0x01 || left || right), and padding slot i holds
 * H("MERKSEAL_PAD" || uint64_be(i)). Roots differ from Legacy roots.
 */
enum class HashScheme { Legacy, DomainSeparated };

std::string hashSchemeToString(HashScheme scheme);

/// @throws std::invalid_argument for unknown names.
HashScheme hashSchemeFromString(const std::string &name);

/**
 * @brief Binary Merkle tree over an ordered leaf set.
 *
 * Every level is retained (level 0 holds the padded leaves, the last
 * level holds the root) so inclusion proofs can be produced.
 */
class MerkleTree {
public:
  /**
   * @brief Build the tree bottom-up.
   * @param leaves Ordered leaf digests, one per file.
   * @throws EmptyInputError if @p leaves is empty.
   */
  explicit MerkleTree(const std::vector<Digest> &leaves,
                      HashScheme scheme = HashScheme::Legacy);

  /// Root only, without retaining intermediate levels.
  static Digest computeRoot(const std::vector<Digest> &leaves,
                            HashScheme scheme = HashScheme::Legacy);

  const Digest &root() const { return levels_.back().front(); }
  std::string rootHex() const { return digestToHex(root()); }

  /// Number of real (unpadded) leaves.
  size_t leafCount() const { return leafCount_; }
  HashScheme scheme() const { return scheme_; }
  const std::vector<std::vector<Digest>> &levels() const { return levels_; }

  /**
   * @brief Sibling digests from leaf to root for the leaf at @p index.
   * @throws std::out_of_range if @p index is not a real leaf.
   */
  std::vector<Digest> proof(size_t index) const;

  /**
   * @brief Check an inclusion proof produced by proof().
   * @param leaf Raw leaf digest (the file hash), before any leaf tagging.
   */
  static bool verifyProof(const Digest &leaf, size_t index,
                          const std::vector<Digest> &proof, const Digest &root,
                          HashScheme scheme = HashScheme::Legacy);

  // Internal node combination for the given scheme.
  static Digest hashPair(const Digest &left, const Digest &right,
                         HashScheme scheme);

private:
  static std::vector<Digest> paddedLeaves(const std::vector<Digest> &leaves,
                                          HashScheme scheme);

  std::vector<std::vector<Digest>> levels_;
  size_t leafCount_;
  HashScheme scheme_;
};

} // namespace merkseal

#endif // MERKSEAL_MERKLE_TREE_HPP
