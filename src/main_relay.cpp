#include "relay/cleanup_scheduler.h"
#include "relay/code_registry.hpp"
#include "relay/relay_http_server.hpp"
#include "relay/relay_service.hpp"
#include "relay/relay_store.hpp"
#include "utilities/config.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <sodium.h>
#include <string>

using namespace quickshare;

int main(int argc, char *argv[]) {
  // Ignore SIGPIPE: prevents termination if writing to a closed socket
  signal(SIGPIPE, SIG_IGN);

  std::string cfgPath = configPath();
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      cfgPath = argv[++i];
    } else {
      std::cerr << "Usage: quickshare_relay [--config <file.yaml>]" << std::endl;
      return 1;
    }
  }

  RelayConfig cfg;
  try {
    cfg = loadRelayConfig(cfgPath);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  std::string logWarning;
  const std::string logFile = resolveLogFile(cfg.logFile, "quickshare_relay", logWarning);
  if (!logWarning.empty()) {
    std::cerr << "WARNING: " << logWarning << std::endl;
  }
  Logger::init(logFile, Logger::levelFromString(cfg.logLevel));

  if (sodium_init() < 0) {
    std::cerr << "FATAL: libsodium initialization failed" << std::endl;
    return 1;
  }
  if (cfg.jwtSecret.empty()) {
    Logger::getInstance().log(LogLevel::WARN, "main",
                              "No jwt_secret configured; all callers act as anonymous");
  }

  relay::RelayStore store;
  relay::PickupCodeRegistry::Options registryOptions;
  registryOptions.defaultUsageLimit = cfg.defaultUsageLimit;
  registryOptions.maxUsageLimit = cfg.maxUsageLimit;
  registryOptions.defaultTtl = std::chrono::hours(cfg.defaultTtlHours);
  registryOptions.maxTtl = std::chrono::hours(cfg.maxTtlHours);
  registryOptions.pepper = cfg.effectivePepper();
  relay::PickupCodeRegistry registry(registryOptions);

  relay::RelayService::Limits limits;
  limits.maxChunkBytes = cfg.maxChunkBytes;
  limits.maxBatchSize = cfg.maxBatchSize;
  relay::RelayService service(registry, store, limits);

  relay::CleanupScheduler cleanup(
      registry, store,
      std::chrono::duration_cast<std::chrono::milliseconds>(cfg.cleanupInterval));

  try {
    boost::asio::io_context ioc;
    relay::RelayHttpServer server(ioc, cfg.listenPort, service, cfg.jwtSecret, &cleanup);
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &, int signo) {
      Logger::getInstance().log(LogLevel::INFO, "main",
                                "Signal " + std::to_string(signo) + ", shutting down");
      ioc.stop();
    });

    cleanup.start();
    server.run();
    Logger::getInstance().log(LogLevel::INFO, "main",
                              "Relay started on port " + std::to_string(server.port()));
    ioc.run();
    server.stop();
    cleanup.stop();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::FATAL, "main",
                              std::string("Relay failed: ") + e.what());
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
