#include "utilities/blockio.hpp"

#include <stdexcept>

namespace merkseal {

BlockIO::BlockIO() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  crypto_hash_sha256_init(&hash_state_);
}

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &hash_state_, reinterpret_cast<const unsigned char *>(data), size);
    ingested_ += size;
  }
}

void BlockIO::ingest(const std::string &data) {
  ingest(reinterpret_cast<const std::byte *>(data.data()), data.size());
}

DigestResult BlockIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }

  DigestResult result;
  crypto_hash_sha256_final(&hash_state_, result.digest.data());
  result.hex = digestToHex(result.digest);
  result.size = ingested_;
  finalized_ = true;
  return result;
}

Digest hashData(const uint8_t *data, size_t size) {
  BlockIO bio;
  bio.ingest(reinterpret_cast<const std::byte *>(data), size);
  return bio.finalize_hashed().digest;
}

Digest hashData(const std::vector<std::byte> &data) {
  BlockIO bio;
  bio.ingest(data.data(), data.size());
  return bio.finalize_hashed().digest;
}

Digest hashData(const std::string &data) {
  BlockIO bio;
  bio.ingest(data);
  return bio.finalize_hashed().digest;
}

} // namespace merkseal
