#ifndef MERKSEAL_BATCH_VERIFIER_HPP
#define MERKSEAL_BATCH_VERIFIER_HPP

#include "anchor/anchor_registry.hpp"
#include "batch/batch_store.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace merkseal {

enum class VerificationStatus {
  Verified,
  BatchNotFound,
  CorruptRecord,
  StorageFailure,
  MissingExternalReference,
  AnchorLookupFailed,
  AnchorMismatch,
  EmptyBatch,
  LocalTamperDetected
};

/// Stable snake_case name, also used as the metrics label.
std::string VerificationStatusToString(VerificationStatus status);

/**
 * @brief Result of one verification run.
 *
 * Roots are lowercase hex without prefix and empty when the run stopped
 * before they were known.
 */
struct VerificationOutcome {
  VerificationStatus status{VerificationStatus::BatchNotFound};
  uint64_t localBatchId{0};
  std::optional<uint64_t> externalBatchId;
  uint64_t fileCount{0};

  std::string storedRoot;
  std::string anchoredRoot;
  std::string recomputedRoot;

  std::string anchorOwner;
  std::string anchorMetaUri;
  uint64_t anchorTimestamp{0};

  std::string detail; // error text of the failing stage
  std::vector<std::string> trail;

  bool verified() const { return status == VerificationStatus::Verified; }
};

/**
 * @brief Checks a stored batch against its anchored root and its files.
 *
 * Stages run in a fixed order and the first failure ends the run:
 * load record, resolve the external id, fetch the anchor, compare stored
 * and anchored roots, recompute from disk, compare recomputed and stored.
 * File contents are never read when the anchor comparison fails.
 */
class BatchVerifier {
public:
  BatchVerifier(BatchStore &store, AnchorRegistry &registry)
      : store_(store), registry_(registry) {}

  /**
   * @param externalBatchId Anchor id to check against. Defaults to the
   *        mantle_batch_id stored in the record.
   */
  VerificationOutcome verify(uint64_t localBatchId,
                             std::optional<uint64_t> externalBatchId = {});

private:
  VerificationOutcome runStages(uint64_t localBatchId,
                                std::optional<uint64_t> externalBatchId);

  BatchStore &store_;
  AnchorRegistry &registry_;
};

} // namespace merkseal

#endif // MERKSEAL_BATCH_VERIFIER_HPP
