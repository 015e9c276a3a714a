#include "utilities/config.hpp"
#include "utilities/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace merkseal {

namespace {

uint64_t parseUnsigned(const std::string &key, const std::string &value) {
  try {
    size_t pos = 0;
    unsigned long long v = std::stoull(value, &pos, 10);
    if (pos != value.size())
      throw std::invalid_argument("trailing characters");
    return static_cast<uint64_t>(v);
  } catch (const std::exception &) {
    throw ConfigError("Invalid value for " + key + ": '" + value + "'");
  }
}

unsigned short parsePort(const std::string &key, const std::string &value) {
  uint64_t v = parseUnsigned(key, value);
  if (v == 0 || v > 65535)
    throw ConfigError("Invalid port for " + key + ": '" + value + "'");
  return static_cast<unsigned short>(v);
}

void applyYaml(MerksealConfig &cfg, const std::string &path) {
  if (!std::filesystem::exists(path))
    return;

  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Failed to parse " + path + ": " + e.what());
  }

  try {
    if (node["rpc_url"])
      cfg.rpcUrl = node["rpc_url"].as<std::string>();
    if (node["chain_id"])
      cfg.chainId = node["chain_id"].as<uint64_t>();
    if (node["registry_address"])
      cfg.registryAddress = node["registry_address"].as<std::string>();
    if (node["var_dir"])
      cfg.varDir = node["var_dir"].as<std::string>();
    if (node["host"])
      cfg.host = node["host"].as<std::string>();
    if (node["port"])
      cfg.port = parsePort("port", node["port"].as<std::string>());
    if (node["threads"])
      cfg.threads = node["threads"].as<unsigned int>();
    if (node["rpc_timeout_ms"])
      cfg.rpcTimeoutMs = node["rpc_timeout_ms"].as<unsigned int>();
    if (node["log_level"])
      cfg.logLevel = logLevelFromString(node["log_level"].as<std::string>());
    if (node["hash_scheme"])
      cfg.hashScheme =
          hashSchemeFromString(node["hash_scheme"].as<std::string>());
  } catch (const YAML::Exception &e) {
    throw ConfigError("Invalid value in " + path + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw ConfigError("Invalid value in " + path + ": " + e.what());
  }
}

void applyEnv(MerksealConfig &cfg) {
  if (const char *env = std::getenv("MANTLE_RPC_URL"))
    cfg.rpcUrl = env;
  if (const char *env = std::getenv("MANTLE_CHAIN_ID"))
    cfg.chainId = parseUnsigned("MANTLE_CHAIN_ID", env);
  if (const char *env = std::getenv("MERKLE_BATCH_REGISTRY_ADDRESS"))
    cfg.registryAddress = env;
  if (const char *env = std::getenv("MERKSEAL_VAR_DIR"))
    cfg.varDir = env;
  if (const char *env = std::getenv("MERKSEAL_HOST"))
    cfg.host = env;
  if (const char *env = std::getenv("MERKSEAL_PORT"))
    cfg.port = parsePort("MERKSEAL_PORT", env);
  if (const char *env = std::getenv("MERKSEAL_HASH_SCHEME")) {
    try {
      cfg.hashScheme = hashSchemeFromString(env);
    } catch (const std::invalid_argument &e) {
      throw ConfigError(std::string("MERKSEAL_HASH_SCHEME: ") + e.what());
    }
  }
}

} // namespace

std::string MerksealConfig::networkName() const {
  return isTestnet() ? "Testnet" : "Mainnet";
}

std::string MerksealConfig::explorerUrl() const {
  return isTestnet() ? "https://explorer.testnet.mantle.xyz"
                     : "https://explorer.mantle.xyz";
}

std::string MerksealConfig::txUrl(const std::string &txHash) const {
  return explorerUrl() + "/tx/" + txHash;
}

std::string MerksealConfig::contractUrl() const {
  return explorerUrl() + "/address/" + registryAddress;
}

void MerksealConfig::requireRegistry() const {
  if (registryAddress.empty()) {
    throw ConfigError(
        "MERKLE_BATCH_REGISTRY_ADDRESS environment variable not set");
  }
}

MerksealConfig loadConfig(const std::string &path) {
  MerksealConfig cfg;
  std::string file = path;
  if (file.empty()) {
    const char *env = std::getenv("MERKSEAL_CONFIG");
    file = env ? env : "merkseal_config.yaml";
  }
  applyYaml(cfg, file);
  applyEnv(cfg);
  return cfg;
}

} // namespace merkseal
