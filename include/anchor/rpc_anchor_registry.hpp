#ifndef MERKSEAL_RPC_ANCHOR_REGISTRY_HPP
#define MERKSEAL_RPC_ANCHOR_REGISTRY_HPP

#include "anchor/anchor_registry.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace merkseal {

/**
 * @brief AnchorRegistry backed by an EVM JSON-RPC endpoint.
 *
 * Each lookup is one eth_call of getBatch(uint256) against the registry
 * contract at block "latest". No retries.
 */
class RpcAnchorRegistry : public AnchorRegistry {
public:
  /// Posts a JSON-RPC request body and returns the response body.
  using Transport = std::function<std::string(const std::string &)>;

  RpcAnchorRegistry(const std::string &rpcUrl, std::string registryAddress,
                    std::chrono::milliseconds timeout);

  /// Uses @p transport instead of HTTP, e.g. a canned responder in tests.
  RpcAnchorRegistry(std::string registryAddress, Transport transport);

  AnchoredBatch getBatch(uint64_t batchId) override;

  /// JSON-RPC request body for a lookup of @p batchId.
  std::string buildRequest(uint64_t batchId) const;

  /**
   * @brief Interpret a JSON-RPC response body.
   * @throws AnchorLookupError NotFound on revert or an empty batch slot,
   *         Transport on anything malformed.
   */
  AnchoredBatch parseResponse(uint64_t batchId, const std::string &body) const;

  const std::string &registryAddress() const { return registryAddress_; }

private:
  std::string registryAddress_;
  Transport transport_;
};

} // namespace merkseal

#endif // MERKSEAL_RPC_ANCHOR_REGISTRY_HPP
