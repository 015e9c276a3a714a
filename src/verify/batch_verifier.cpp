#include "verify/batch_verifier.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace merkseal {

std::string VerificationStatusToString(VerificationStatus status) {
  switch (status) {
  case VerificationStatus::Verified:
    return "verified";
  case VerificationStatus::BatchNotFound:
    return "batch_not_found";
  case VerificationStatus::CorruptRecord:
    return "corrupt_record";
  case VerificationStatus::StorageFailure:
    return "storage_failure";
  case VerificationStatus::MissingExternalReference:
    return "missing_external_reference";
  case VerificationStatus::AnchorLookupFailed:
    return "anchor_lookup_failed";
  case VerificationStatus::AnchorMismatch:
    return "anchor_mismatch";
  case VerificationStatus::EmptyBatch:
    return "empty_batch";
  case VerificationStatus::LocalTamperDetected:
    return "local_tamper_detected";
  }
  return "unknown";
}

VerificationOutcome
BatchVerifier::verify(uint64_t localBatchId,
                      std::optional<uint64_t> externalBatchId) {
  VerificationOutcome outcome = runStages(localBatchId, externalBatchId);
  const std::string name = VerificationStatusToString(outcome.status);

  MetricsRegistry::instance().incrementCounter(
      "merkseal_verifications_total", 1.0, {{"status", name}});
  std::string msg = "Verification of batch " + std::to_string(localBatchId) +
                    ": " + name;
  if (!outcome.detail.empty())
    msg += " (" + outcome.detail + ")";
  Logger::getInstance().log(outcome.verified() ? LogLevel::INFO
                                               : LogLevel::WARN,
                            msg);
  return outcome;
}

VerificationOutcome
BatchVerifier::runStages(uint64_t localBatchId,
                         std::optional<uint64_t> externalBatchId) {
  VerificationOutcome out;
  out.localBatchId = localBatchId;
  const std::string localText = std::to_string(localBatchId);

  // 1. local record
  BatchRecord record;
  try {
    record = store_.load(localBatchId);
  } catch (const NotFoundError &e) {
    out.status = VerificationStatus::BatchNotFound;
    out.detail = e.what();
    return out;
  } catch (const CorruptRecordError &e) {
    out.status = VerificationStatus::CorruptRecord;
    out.detail = e.what();
    return out;
  } catch (const StorageError &e) {
    out.status = VerificationStatus::StorageFailure;
    out.detail = e.what();
    return out;
  }
  out.fileCount = record.fileCount;
  out.storedRoot = normalizeDigestHex(record.root);
  out.trail.push_back("Loaded local batch " + localText + " (" +
                      std::to_string(record.fileCount) +
                      " files, root 0x" + out.storedRoot + ")");

  // 2. external id
  if (externalBatchId) {
    out.externalBatchId = externalBatchId;
  } else if (record.mantleBatchId) {
    out.externalBatchId = record.mantleBatchId;
  } else {
    out.status = VerificationStatus::MissingExternalReference;
    out.detail = "batch " + localText +
                 " has no mantle_batch_id and none was given";
    return out;
  }
  const std::string externalText = std::to_string(*out.externalBatchId);
  out.trail.push_back("Using anchored batch " + externalText);

  // 3. anchored root
  AnchoredBatch anchored;
  try {
    anchored = registry_.getBatch(*out.externalBatchId);
  } catch (const AnchorLookupError &e) {
    out.status = VerificationStatus::AnchorLookupFailed;
    out.detail = e.what();
    return out;
  }
  out.anchoredRoot = digestToHex(anchored.root);
  out.anchorOwner = anchored.owner;
  out.anchorMetaUri = anchored.metaUri;
  out.anchorTimestamp = anchored.timestamp;
  out.trail.push_back("Fetched anchored root 0x" + out.anchoredRoot +
                      " (owner " + anchored.owner + ", timestamp " +
                      std::to_string(anchored.timestamp) + ")");

  // 4. stored vs anchored, before touching any file
  if (!digestHexEquals(out.storedRoot, out.anchoredRoot)) {
    out.status = VerificationStatus::AnchorMismatch;
    out.detail = "stored root 0x" + out.storedRoot +
                 " != anchored root 0x" + out.anchoredRoot;
    return out;
  }
  out.trail.push_back("Stored root matches anchored root");

  // 5. recompute from disk
  Digest recomputed{};
  try {
    recomputed = store_.recomputeRoot(localBatchId);
  } catch (const EmptyInputError &e) {
    out.status = VerificationStatus::EmptyBatch;
    out.detail = e.what();
    return out;
  } catch (const StorageError &e) {
    out.status = VerificationStatus::StorageFailure;
    out.detail = e.what();
    return out;
  }
  out.recomputedRoot = digestToHex(recomputed);
  out.trail.push_back("Recomputed root 0x" + out.recomputedRoot +
                      " from files on disk");

  // 6. recomputed vs stored
  if (!digestHexEquals(out.recomputedRoot, out.storedRoot)) {
    out.status = VerificationStatus::LocalTamperDetected;
    out.detail = "recomputed root 0x" + out.recomputedRoot +
                 " != stored root 0x" + out.storedRoot;
    return out;
  }
  out.trail.push_back("Recomputed root matches stored root");

  out.status = VerificationStatus::Verified;
  return out;
}

} // namespace merkseal
