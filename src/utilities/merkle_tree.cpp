#include "utilities/merkle_tree.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"

#include <stdexcept>

namespace merkseal {

namespace {

const std::byte LEAF_TAG{0x00};
const std::byte NODE_TAG{0x01};
const char PAD_LABEL[] = "MERKSEAL_PAD";

Digest tagLeaf(const Digest &leaf) {
  BlockIO bio;
  bio.ingest(&LEAF_TAG, 1);
  bio.ingest(reinterpret_cast<const std::byte *>(leaf.data()), leaf.size());
  return bio.finalize_hashed().digest;
}

Digest padDigest(size_t index, HashScheme scheme) {
  if (scheme == HashScheme::Legacy)
    return ZERO_DIGEST;

  BlockIO bio;
  bio.ingest(reinterpret_cast<const std::byte *>(PAD_LABEL),
             sizeof(PAD_LABEL) - 1);
  std::byte be[8];
  uint64_t v = static_cast<uint64_t>(index);
  for (int i = 7; i >= 0; --i) {
    be[i] = static_cast<std::byte>(v & 0xff);
    v >>= 8;
  }
  bio.ingest(be, sizeof(be));
  return bio.finalize_hashed().digest;
}

size_t nextPowerOfTwo(size_t n) {
  size_t p = 1;
  while (p < n)
    p <<= 1;
  return p;
}

} // namespace

std::string hashSchemeToString(HashScheme scheme) {
  switch (scheme) {
  case HashScheme::Legacy:
    return "legacy";
  case HashScheme::DomainSeparated:
    return "domain-separated";
  }
  return "unknown";
}

HashScheme hashSchemeFromString(const std::string &name) {
  if (name == "legacy")
    return HashScheme::Legacy;
  if (name == "domain-separated")
    return HashScheme::DomainSeparated;
  throw std::invalid_argument("Unknown hash scheme: " + name);
}

Digest MerkleTree::hashPair(const Digest &left, const Digest &right,
                            HashScheme scheme) {
  BlockIO bio;
  if (scheme == HashScheme::DomainSeparated)
    bio.ingest(&NODE_TAG, 1);
  bio.ingest(reinterpret_cast<const std::byte *>(left.data()), left.size());
  bio.ingest(reinterpret_cast<const std::byte *>(right.data()), right.size());
  return bio.finalize_hashed().digest;
}

std::vector<Digest> MerkleTree::paddedLeaves(const std::vector<Digest> &leaves,
                                             HashScheme scheme) {
  if (leaves.empty()) {
    throw EmptyInputError("Cannot build a Merkle tree with zero leaves");
  }

  std::vector<Digest> level;
  const size_t width = nextPowerOfTwo(leaves.size());
  level.reserve(width);
  for (const auto &leaf : leaves) {
    level.push_back(scheme == HashScheme::DomainSeparated ? tagLeaf(leaf)
                                                          : leaf);
  }
  while (level.size() < width) {
    level.push_back(padDigest(level.size(), scheme));
  }
  return level;
}

MerkleTree::MerkleTree(const std::vector<Digest> &leaves, HashScheme scheme)
    : leafCount_(leaves.size()), scheme_(scheme) {
  levels_.push_back(paddedLeaves(leaves, scheme));

  while (levels_.back().size() > 1) {
    const auto &current = levels_.back();
    std::vector<Digest> next;
    next.reserve(current.size() / 2);
    for (size_t i = 0; i < current.size(); i += 2) {
      next.push_back(hashPair(current[i], current[i + 1], scheme));
    }
    levels_.push_back(std::move(next));
  }
}

Digest MerkleTree::computeRoot(const std::vector<Digest> &leaves,
                               HashScheme scheme) {
  std::vector<Digest> current = paddedLeaves(leaves, scheme);
  while (current.size() > 1) {
    std::vector<Digest> next;
    next.reserve(current.size() / 2);
    for (size_t i = 0; i < current.size(); i += 2) {
      next.push_back(hashPair(current[i], current[i + 1], scheme));
    }
    current = std::move(next);
  }
  return current.front();
}

std::vector<Digest> MerkleTree::proof(size_t index) const {
  if (index >= leafCount_) {
    throw std::out_of_range("Leaf index " + std::to_string(index) +
                            " out of range for " + std::to_string(leafCount_) +
                            " leaves");
  }
  std::vector<Digest> path;
  size_t idx = index;
  for (size_t level = 0; level + 1 < levels_.size(); ++level) {
    path.push_back(levels_[level][idx ^ 1]);
    idx >>= 1;
  }
  return path;
}

bool MerkleTree::verifyProof(const Digest &leaf, size_t index,
                             const std::vector<Digest> &proof,
                             const Digest &root, HashScheme scheme) {
  Digest acc = scheme == HashScheme::DomainSeparated ? tagLeaf(leaf) : leaf;
  size_t idx = index;
  for (const auto &sibling : proof) {
    if ((idx & 1U) == 0U) {
      acc = hashPair(acc, sibling, scheme);
    } else {
      acc = hashPair(sibling, acc, scheme);
    }
    idx >>= 1U;
  }
  // Any leftover index bits mean the proof is too short for the position.
  return idx == 0 && acc == root;
}

} // namespace merkseal
