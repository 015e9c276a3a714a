#ifndef MERKSEAL_ANCHOR_REGISTRY_HPP
#define MERKSEAL_ANCHOR_REGISTRY_HPP

#include "utilities/digest.hpp"
#include <cstdint>
#include <string>

namespace merkseal {

/// A batch as recorded on the external ledger.
struct AnchoredBatch {
  Digest root{};
  std::string owner;   // 0x-prefixed lowercase address
  std::string metaUri;
  uint64_t timestamp{0}; // seconds since epoch, never 0 for a real batch
};

/**
 * @brief Read-only view of the external registry that anchors batch roots.
 */
class AnchorRegistry {
public:
  virtual ~AnchorRegistry() = default;

  /**
   * @brief Fetch the anchored batch stored under @p batchId.
   * @throws AnchorLookupError of kind NotFound if the registry holds no such
   *         batch, or Transport if it could not be asked.
   */
  virtual AnchoredBatch getBatch(uint64_t batchId) = 0;
};

} // namespace merkseal

#endif // MERKSEAL_ANCHOR_REGISTRY_HPP
