#ifndef MERKSEAL_BATCH_STORE_HPP
#define MERKSEAL_BATCH_STORE_HPP

#include "batch/batch_id_allocator.hpp"
#include "batch/batch_record.hpp"
#include "utilities/digest.hpp"
#include "utilities/merkle_tree.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace merkseal {

/// One named file of a batch.
struct BatchFile {
  std::string name;
  std::vector<std::byte> data;
};

/**
 * @brief Durable storage of batches under <root>/<local_batch_id>/.
 *
 * Each batch directory holds the file blobs under their uploaded names and
 * a metadata.json record. Files are always processed in lexicographic name
 * order, which fixes the leaf order of the Merkle tree.
 */
class BatchStore {
public:
  static const std::string METADATA_FILE;

  /**
   * @param rootDir Directory that holds one sub-directory per batch.
   * @param scheme Hashing scheme used for every root this store computes.
   * @param ids Id source for create(files, ...).
   */
  explicit BatchStore(std::string rootDir,
                      HashScheme scheme = HashScheme::Legacy,
                      BatchIdAllocator &ids = BatchIdAllocator::instance());
  virtual ~BatchStore() = default;

  /**
   * @brief Hash, persist and record a new batch under a fresh id.
   *
   * Blobs are written first; metadata.json is written only after every
   * blob succeeded, so a failed create never leaves a loadable record.
   *
   * @throws EmptyInputError if @p files is empty.
   * @throws std::invalid_argument for unsafe, reserved or duplicate names.
   * @throws StorageError on any filesystem failure.
   */
  BatchRecord create(const std::vector<BatchFile> &files,
                     const std::string &registryAddress);

  /// As above with an explicit id. Fails if the batch directory exists.
  BatchRecord create(uint64_t batchId, const std::vector<BatchFile> &files,
                     const std::string &registryAddress);

  /**
   * @brief Read the record of a batch.
   * @throws NotFoundError if no record exists.
   * @throws CorruptRecordError if the record cannot be parsed.
   * @throws StorageError if the record exists but cannot be read.
   */
  BatchRecord load(uint64_t batchId) const;

  /**
   * @brief Read every blob of a batch in leaf order.
   * @throws StorageError if the directory or a blob cannot be read.
   */
  virtual std::vector<BatchFile> loadFiles(uint64_t batchId) const;

  /**
   * @brief Rebuild the root from the blobs currently on disk.
   * @throws EmptyInputError if the batch directory holds no blobs.
   */
  Digest recomputeRoot(uint64_t batchId) const;

  /**
   * @brief Attach the external anchor identifier to a batch.
   *
   * Recording the same id twice is a no-op.
   * @throws std::logic_error if a different id is already recorded.
   */
  BatchRecord recordAnchor(uint64_t batchId, uint64_t mantleBatchId);

  /// Largest numeric batch directory name, 0 if there is none.
  uint64_t highestBatchId() const;

  bool exists(uint64_t batchId) const;
  std::string batchDir(uint64_t batchId) const;
  const std::string &rootDir() const { return rootDir_; }
  HashScheme scheme() const { return scheme_; }

  /// @throws std::invalid_argument if @p name is not a safe blob name.
  static void validateFileName(const std::string &name);

private:
  void writeRecord(const BatchRecord &record) const;

  std::string rootDir_;
  HashScheme scheme_;
  BatchIdAllocator &ids_;
  std::mutex anchorMutex_;
};

} // namespace merkseal

#endif // MERKSEAL_BATCH_STORE_HPP
