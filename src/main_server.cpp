// Entry point for the MerkSeal upload server

#include "batch/batch_id_allocator.hpp"
#include "batch/batch_store.hpp"
#include "server/upload_server.hpp"
#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <boost/asio.hpp>
#include <filesystem>
#include <iostream>
#include <signal.h> // For signal(), SIGPIPE, SIG_IGN
#include <sodium.h>
#include <thread>
#include <vector>

using namespace merkseal;

int main(int argc, char *argv[]) {
  // Ignore SIGPIPE: prevents termination if a client closes mid-response
  signal(SIGPIPE, SIG_IGN);

  std::string configPath;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else {
      std::cerr << "Usage: merkseal_server [--config <file>]" << std::endl;
      return 2;
    }
  }

  if (sodium_init() < 0) {
    std::cerr << "FATAL: Failed to initialize libsodium" << std::endl;
    return 1;
  }

  MerksealConfig cfg;
  try {
    cfg = loadConfig(configPath);
    cfg.requireRegistry();
  } catch (const ConfigError &e) {
    std::cerr << "FATAL: Failed to load config: " << e.what() << std::endl;
    return 1;
  }

  if (!cfg.varDir.empty())
    setVarDir(cfg.varDir);
  std::error_code ec;
  std::filesystem::create_directories(logsDir(), ec);
  if (ec) {
    std::cerr << "FATAL: Cannot create " << logsDir() << ": " << ec.message()
              << std::endl;
    return 1;
  }
  Logger::init(logsDir() + "/merkseal_server.log", cfg.logLevel);
  Logger &log = Logger::getInstance();

  try {
    BatchStore store(batchesDir(), cfg.hashScheme);
    const uint64_t highest = store.highestBatchId();
    BatchIdAllocator::instance().advancePast(highest);

    boost::asio::io_context ioc;
    UploadServer server(ioc, cfg.host, cfg.port, store, cfg.registryAddress);

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &, int signo) {
      log.log(LogLevel::INFO,
              "Signal " + std::to_string(signo) + " received, shutting down");
      // run() returns once in-flight connections have completed.
      server.stop();
    });

    server.run();
    log.log(LogLevel::INFO,
            "MerkSeal server listening on http://" + cfg.host + ":" +
                std::to_string(server.port()) + " (" + cfg.networkName() +
                ", chain " + std::to_string(cfg.chainId) + ", registry " +
                cfg.registryAddress + ", scheme " +
                hashSchemeToString(cfg.hashScheme) + ", next batch id " +
                std::to_string(BatchIdAllocator::instance().peek()) + ")");
    std::cout << "MerkSeal server listening on http://" << cfg.host << ":"
              << server.port() << std::endl;

    const unsigned int threads = cfg.threads == 0 ? 1 : cfg.threads;
    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (unsigned int i = 1; i < threads; ++i)
      workers.emplace_back([&ioc]() { ioc.run(); });
    ioc.run();
    for (auto &t : workers)
      t.join();
  } catch (const std::exception &e) {
    log.log(LogLevel::FATAL, std::string("Server failed: ") + e.what());
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  log.log(LogLevel::INFO, "MerkSeal server stopped");
  return 0;
}
