#ifndef MERKSEAL_BLOCKIO_HPP
#define MERKSEAL_BLOCKIO_HPP

#include "utilities/digest.hpp"
#include <cstddef>
#include <sodium.h>
#include <string>
#include <vector>

namespace merkseal {

struct DigestResult {
  Digest digest;   // SHA-256 of everything ingested
  std::string hex; // digest as lowercase hex, no prefix
  size_t size{0};  // number of bytes ingested
};

/**
 * @brief Streaming SHA-256 hasher for file contents.
 *
 * Data can be fed in any number of ingest() calls; the digest equals the
 * digest of the concatenation.
 */
class BlockIO {
public:
  /**
   * @brief Construct a hasher.
   * @throw std::runtime_error If libsodium cannot be initialised.
   */
  BlockIO();

  // Appends data to the running hash.
  void ingest(const std::byte *data, size_t size);
  void ingest(const std::string &data);

  /**
   * @brief Finalize the hash.
   * @throw std::logic_error If called more than once.
   */
  DigestResult finalize_hashed();

private:
  crypto_hash_sha256_state hash_state_;
  size_t ingested_ = 0;
  bool finalized_ = false;
};

/// One-shot SHA-256 of a byte buffer. Total over all inputs, including empty.
Digest hashData(const std::vector<std::byte> &data);
Digest hashData(const std::string &data);
Digest hashData(const uint8_t *data, size_t size);

} // namespace merkseal

#endif // MERKSEAL_BLOCKIO_HPP
