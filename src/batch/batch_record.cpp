#include "batch/batch_record.hpp"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"

namespace merkseal {

nlohmann::ordered_json batchRecordToJson(const BatchRecord &record) {
  nlohmann::ordered_json j;
  j["local_batch_id"] = record.localBatchId;
  j["root"] = record.root;
  j["file_count"] = record.fileCount;
  j["suggested_meta_uri"] = record.suggestedMetaUri;
  j["registry_address"] = record.registryAddress;
  if (record.mantleBatchId)
    j["mantle_batch_id"] = *record.mantleBatchId;
  return j;
}

namespace {

const nlohmann::json &requireField(const nlohmann::json &j, const char *key,
                                   uint64_t batchId) {
  auto it = j.find(key);
  if (it == j.end())
    throw CorruptRecordError(batchId, std::string("missing field '") + key +
                                          "'");
  return *it;
}

uint64_t requireUnsigned(const nlohmann::json &j, const char *key,
                         uint64_t batchId) {
  const auto &v = requireField(j, key, batchId);
  if (!v.is_number_unsigned())
    throw CorruptRecordError(batchId, std::string("field '") + key +
                                          "' is not an unsigned integer");
  return v.get<uint64_t>();
}

std::string requireString(const nlohmann::json &j, const char *key,
                          uint64_t batchId) {
  const auto &v = requireField(j, key, batchId);
  if (!v.is_string())
    throw CorruptRecordError(batchId,
                             std::string("field '") + key + "' is not a string");
  return v.get<std::string>();
}

} // namespace

BatchRecord batchRecordFromJson(const std::string &text, uint64_t batchId) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded())
    throw CorruptRecordError(batchId, "metadata is not valid JSON");
  if (!j.is_object())
    throw CorruptRecordError(batchId, "metadata is not a JSON object");

  BatchRecord record;
  record.localBatchId = requireUnsigned(j, "local_batch_id", batchId);
  if (record.localBatchId != batchId) {
    throw CorruptRecordError(batchId,
                             "local_batch_id " +
                                 std::to_string(record.localBatchId) +
                                 " does not match its location");
  }
  record.root = requireString(j, "root", batchId);
  if (!isDigestHex(record.root))
    throw CorruptRecordError(batchId, "root '" + record.root +
                                          "' is not a 32-byte hex digest");
  record.fileCount = requireUnsigned(j, "file_count", batchId);
  record.suggestedMetaUri = requireString(j, "suggested_meta_uri", batchId);
  record.registryAddress = requireString(j, "registry_address", batchId);

  auto it = j.find("mantle_batch_id");
  if (it != j.end() && !it->is_null()) {
    if (!it->is_number_unsigned())
      throw CorruptRecordError(
          batchId, "field 'mantle_batch_id' is not an unsigned integer");
    record.mantleBatchId = it->get<uint64_t>();
  }
  return record;
}

std::string suggestedMetaUriFor(uint64_t batchId) {
  return "ipfs://placeholder-" + std::to_string(batchId);
}

} // namespace merkseal
