// Command line front end: verification, configuration and offline helpers

#include "anchor/rpc_anchor_registry.hpp"
#include "batch/batch_store.hpp"
#include "utilities/blockio.hpp"
#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/merkle_tree.hpp"
#include "utilities/var_dir.hpp"
#include "verify/batch_verifier.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace merkseal;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void printUsage() {
  std::cout
      << "Usage: merkseal [--config <file>] <command> [options]\n"
      << "  verify --batch-id <n> [--mantle-batch-id <m>]\n"
      << "  config\n"
      << "  root <file>...\n"
      << "  anchor-id --batch-id <n> --mantle-batch-id <m>\n";
}

struct Args {
  std::string command;
  std::map<std::string, std::string> options;
  std::vector<std::string> positional;
};

// Returns std::nullopt on a malformed command line.
std::optional<Args> parseArgs(int argc, char *argv[]) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return std::nullopt;
      }
      args.options[arg.substr(2)] = argv[++i];
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }
  return args;
}

std::optional<uint64_t> parseId(const Args &args, const std::string &key) {
  auto it = args.options.find(key);
  if (it == args.options.end())
    return std::nullopt;
  const std::string &text = it->second;
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
    throw std::invalid_argument("--" + key + " expects a number, got '" +
                                text + "'");
  try {
    return std::stoull(text);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("--" + key + " is out of range");
  }
}

void initLogging(const MerksealConfig &cfg) {
  std::error_code ec;
  std::filesystem::create_directories(logsDir(), ec);
  if (ec) {
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::ERROR);
    return;
  }
  Logger::init(logsDir() + "/merkseal_cli.log", cfg.logLevel);
}

int configCommand(const MerksealConfig &cfg) {
  std::cout << "RPC URL:   " << cfg.rpcUrl << "\n"
            << "Chain ID:  " << cfg.chainId << "\n"
            << "Registry:  "
            << (cfg.registryAddress.empty() ? "(not set)"
                                            : cfg.registryAddress)
            << "\n"
            << "Network:   " << cfg.networkName() << "\n"
            << "Explorer:  " << cfg.explorerUrl() << "\n";
  if (!cfg.registryAddress.empty())
    std::cout << "Contract:  " << cfg.contractUrl() << "\n";
  std::cout << "Var dir:   " << getVarDir() << "\n"
            << "Scheme:    " << hashSchemeToString(cfg.hashScheme)
            << std::endl;
  return EXIT_OK;
}

int verifyCommand(const MerksealConfig &cfg, const Args &args) {
  auto localId = parseId(args, "batch-id");
  if (!localId) {
    std::cerr << "verify requires --batch-id" << std::endl;
    return EXIT_USAGE;
  }
  auto externalId = parseId(args, "mantle-batch-id");
  cfg.requireRegistry();

  BatchStore store(batchesDir(), cfg.hashScheme);
  RpcAnchorRegistry registry(cfg.rpcUrl, cfg.registryAddress,
                             std::chrono::milliseconds(cfg.rpcTimeoutMs));
  BatchVerifier verifier(store, registry);

  std::cout << "Verifying local batch " << *localId << " on Mantle "
            << cfg.networkName() << " (" << cfg.rpcUrl << ")" << std::endl;
  VerificationOutcome out = verifier.verify(*localId, externalId);
  for (const auto &line : out.trail)
    std::cout << "  ok  " << line << "\n";

  if (out.verified()) {
    std::cout << "VERIFIED: local batch " << out.localBatchId
              << " matches Mantle batch " << *out.externalBatchId << " ("
              << out.fileCount << " files, root 0x" << out.storedRoot << ")\n";
    if (!out.anchorMetaUri.empty())
      std::cout << "  Meta URI: " << out.anchorMetaUri << "\n";
    std::cout << "  Registry: " << cfg.contractUrl() << std::endl;
    return EXIT_OK;
  }

  std::cout << "FAILED: " << VerificationStatusToString(out.status) << "\n"
            << "  " << out.detail << "\n";
  switch (out.status) {
  case VerificationStatus::AnchorMismatch:
    std::cout << "  stored:     0x" << out.storedRoot << "\n"
              << "  anchored:   0x" << out.anchoredRoot << "\n";
    break;
  case VerificationStatus::LocalTamperDetected:
    std::cout << "  recomputed: 0x" << out.recomputedRoot << "\n"
              << "  stored:     0x" << out.storedRoot << "\n";
    break;
  default:
    break;
  }
  std::cout << std::flush;
  return EXIT_FAILED;
}

int rootCommand(const MerksealConfig &cfg, const Args &args) {
  if (args.positional.empty()) {
    std::cerr << "root requires at least one file" << std::endl;
    return EXIT_USAGE;
  }
  std::vector<Digest> leaves;
  for (const auto &path : args.positional) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
      throw StorageError(path, "cannot open file");
    BlockIO bio;
    char buf[64 * 1024];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0)
      bio.ingest(reinterpret_cast<const std::byte *>(buf),
                 static_cast<size_t>(in.gcount()));
    if (in.bad())
      throw StorageError(path, "read failed");
    DigestResult res = bio.finalize_hashed();
    std::cout << res.hex << "  " << path << "\n";
    leaves.push_back(res.digest);
  }
  MerkleTree tree(leaves, cfg.hashScheme);
  std::cout << "root 0x" << tree.rootHex() << " ("
            << hashSchemeToString(cfg.hashScheme) << ")" << std::endl;
  return EXIT_OK;
}

int anchorIdCommand(const MerksealConfig &cfg, const Args &args) {
  auto localId = parseId(args, "batch-id");
  auto externalId = parseId(args, "mantle-batch-id");
  if (!localId || !externalId) {
    std::cerr << "anchor-id requires --batch-id and --mantle-batch-id"
              << std::endl;
    return EXIT_USAGE;
  }
  BatchStore store(batchesDir(), cfg.hashScheme);
  BatchRecord record = store.recordAnchor(*localId, *externalId);
  std::cout << "Local batch " << record.localBatchId
            << " now references Mantle batch " << *record.mantleBatchId
            << std::endl;
  return EXIT_OK;
}

} // namespace

int main(int argc, char *argv[]) {
  auto args = parseArgs(argc, argv);
  if (!args || args->command.empty() || args->command == "help") {
    printUsage();
    return args && args->command == "help" ? EXIT_OK : EXIT_USAGE;
  }

  MerksealConfig cfg;
  try {
    auto cfgPath = args->options.find("config");
    cfg = loadConfig(cfgPath == args->options.end() ? "" : cfgPath->second);
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return EXIT_FAILED;
  }
  if (!cfg.varDir.empty())
    setVarDir(cfg.varDir);
  initLogging(cfg);

  try {
    if (args->command == "verify")
      return verifyCommand(cfg, *args);
    if (args->command == "config")
      return configCommand(cfg);
    if (args->command == "root")
      return rootCommand(cfg, *args);
    if (args->command == "anchor-id")
      return anchorIdCommand(cfg, *args);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_USAGE;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FAILED;
  }

  std::cerr << "Unknown command: " << args->command << std::endl;
  printUsage();
  return EXIT_USAGE;
}
