#ifndef QUICKSHARE_CONFIG_HPP
#define QUICKSHARE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace quickshare {

/** Server-side settings for the relay. */
struct RelayConfig {
  unsigned short listenPort = 8000;
  std::string jwtSecret;
  std::string dedupePepper;
  std::chrono::seconds cleanupInterval{60};
  unsigned int defaultUsageLimit = 3;
  unsigned int maxUsageLimit = 100;
  unsigned int defaultTtlHours = 24;
  unsigned int maxTtlHours = 168;
  std::size_t maxChunkBytes = 1024 * 1024 + 28;
  std::size_t maxBatchSize = 100;
  std::string logFile;
  std::string logLevel = "INFO";

  /** Pepper used for dedup fingerprints after applying fallbacks. */
  std::string effectivePepper() const;
};

/** Client-side knobs of the transfer orchestrator. */
struct TransferConfig {
  std::size_t chunkSize = 64 * 1024;
  std::size_t batchSize = 25;
  std::size_t downloadConcurrency = 3;
  int chunkUploadAttempts = 3;
  std::chrono::milliseconds chunkRetryInterval{200};
  int keyPollAttempts = 10;
  std::chrono::milliseconds keyPollInterval{1000};
};

/** Path of the YAML config: $QUICKSHARE_CONFIG or quickshare_relay.yaml. */
std::string configPath();

/**
 * @brief Load relay settings from @p path, then apply QUICKSHARE_* environment
 * overrides. A missing file leaves the defaults in place.
 * @throw std::runtime_error if the file exists but cannot be parsed.
 */
RelayConfig loadRelayConfig(const std::string &path);

/** Load the `transfer:` section of @p path (defaults if absent). */
TransferConfig loadTransferConfig(const std::string &path);

} // namespace quickshare

#endif // QUICKSHARE_CONFIG_HPP
