#ifndef MERKSEAL_CONFIG_HPP
#define MERKSEAL_CONFIG_HPP

#include "utilities/logger.h"
#include "utilities/merkle_tree.hpp"
#include <cstdint>
#include <string>

namespace merkseal {

inline constexpr uint64_t MANTLE_TESTNET_CHAIN_ID = 5003;
inline constexpr uint64_t MANTLE_MAINNET_CHAIN_ID = 5000;

/**
 * @brief Runtime options for the server and the verification CLI.
 *
 * None of the network settings affect how roots are computed; they only
 * choose which registry is consulted and which explorer links are shown.
 */
struct MerksealConfig {
  std::string rpcUrl = "https://rpc.sepolia.mantle.xyz";
  uint64_t chainId = MANTLE_TESTNET_CHAIN_ID;
  std::string registryAddress;

  std::string varDir;
  std::string host = "127.0.0.1";
  unsigned short port = 8080;
  unsigned int threads = 2;
  unsigned int rpcTimeoutMs = 10000;
  LogLevel logLevel = LogLevel::INFO;
  HashScheme hashScheme = HashScheme::Legacy;

  bool isTestnet() const { return chainId == MANTLE_TESTNET_CHAIN_ID; }
  bool isMainnet() const { return chainId == MANTLE_MAINNET_CHAIN_ID; }
  std::string networkName() const;

  std::string explorerUrl() const;
  std::string txUrl(const std::string &txHash) const;
  std::string contractUrl() const;

  /// @throws ConfigError if no registry address is configured.
  void requireRegistry() const;
};

/**
 * @brief Load configuration from YAML, then apply environment overrides.
 *
 * @param path YAML file. Empty means $MERKSEAL_CONFIG, else
 *        "merkseal_config.yaml". A missing file leaves the defaults.
 * @throws ConfigError if the file is malformed or a value is invalid.
 */
MerksealConfig loadConfig(const std::string &path = "");

} // namespace merkseal

#endif // MERKSEAL_CONFIG_HPP
