#ifndef MERKSEAL_BATCH_RECORD_HPP
#define MERKSEAL_BATCH_RECORD_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace merkseal {

/**
 * @brief Persisted metadata binding a local batch id to its Merkle root.
 *
 * Immutable after creation except for mantleBatchId, which is set once
 * when the batch has been anchored externally.
 */
struct BatchRecord {
  uint64_t localBatchId{0};
  std::string root; // lowercase hex, no 0x prefix
  uint64_t fileCount{0};
  std::string suggestedMetaUri;
  std::string registryAddress;
  std::optional<uint64_t> mantleBatchId;
};

/// Field order matches the on-disk metadata.json layout.
nlohmann::ordered_json batchRecordToJson(const BatchRecord &record);

/**
 * @brief Parse a record from its JSON text.
 * @param batchId Identifier the record was loaded for, used in errors and
 *        checked against local_batch_id.
 * @throws CorruptRecordError if the text is not a well formed record.
 */
BatchRecord batchRecordFromJson(const std::string &text, uint64_t batchId);

/// Placeholder metadata location handed out at upload time.
std::string suggestedMetaUriFor(uint64_t batchId);

} // namespace merkseal

#endif // MERKSEAL_BATCH_RECORD_HPP
