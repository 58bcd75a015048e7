#include "utilities/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace quickshare {

namespace {

const char *kDefaultPepper = "quick-share-default-pepper";

YAML::Node loadYaml(const std::string &path) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return YAML::Node();
  }
  try {
    return YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to parse config " + path + ": " +
                             e.what());
  }
}

template <typename T> void readIfPresent(const YAML::Node &node,
                                         const char *key, T &out) {
  if (node && node[key]) {
    out = node[key].as<T>();
  }
}

} // namespace

std::string RelayConfig::effectivePepper() const {
  if (!dedupePepper.empty())
    return dedupePepper;
  if (!jwtSecret.empty())
    return jwtSecret;
  return kDefaultPepper;
}

std::string configPath() {
  const char *cfg = std::getenv("QUICKSHARE_CONFIG");
  return cfg ? std::string(cfg) : std::string("quickshare_relay.yaml");
}

RelayConfig loadRelayConfig(const std::string &path) {
  RelayConfig cfg;
  YAML::Node node = loadYaml(path);
  try {
    readIfPresent(node, "listen_port", cfg.listenPort);
    readIfPresent(node, "jwt_secret", cfg.jwtSecret);
    readIfPresent(node, "dedupe_pepper", cfg.dedupePepper);
    if (node && node["cleanup_interval_seconds"]) {
      cfg.cleanupInterval = std::chrono::seconds(
          node["cleanup_interval_seconds"].as<long long>());
    }
    readIfPresent(node, "default_usage_limit", cfg.defaultUsageLimit);
    readIfPresent(node, "max_usage_limit", cfg.maxUsageLimit);
    readIfPresent(node, "default_ttl_hours", cfg.defaultTtlHours);
    readIfPresent(node, "max_ttl_hours", cfg.maxTtlHours);
    readIfPresent(node, "max_chunk_bytes", cfg.maxChunkBytes);
    readIfPresent(node, "max_batch_size", cfg.maxBatchSize);
    readIfPresent(node, "log_file", cfg.logFile);
    readIfPresent(node, "log_level", cfg.logLevel);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Invalid value in config " + path + ": " +
                             e.what());
  }

  if (const char *env = std::getenv("QUICKSHARE_PORT"))
    cfg.listenPort = static_cast<unsigned short>(std::atoi(env));
  if (const char *env = std::getenv("QUICKSHARE_JWT_SECRET"))
    cfg.jwtSecret = env;
  if (const char *env = std::getenv("QUICKSHARE_DEDUPE_PEPPER"))
    cfg.dedupePepper = env;
  if (const char *env = std::getenv("QUICKSHARE_LOG_LEVEL"))
    cfg.logLevel = env;

  if (cfg.defaultUsageLimit == 0 || cfg.defaultUsageLimit > cfg.maxUsageLimit)
    throw std::runtime_error("default_usage_limit must be in [1, max_usage_limit]");
  if (cfg.defaultTtlHours == 0 || cfg.defaultTtlHours > cfg.maxTtlHours)
    throw std::runtime_error("default_ttl_hours must be in [1, max_ttl_hours]");
  if (cfg.cleanupInterval.count() <= 0)
    throw std::runtime_error("cleanup_interval_seconds must be positive");
  return cfg;
}

TransferConfig loadTransferConfig(const std::string &path) {
  TransferConfig cfg;
  YAML::Node root = loadYaml(path);
  if (!root || !root["transfer"]) {
    return cfg;
  }
  const YAML::Node node = root["transfer"];
  try {
    readIfPresent(node, "chunk_size", cfg.chunkSize);
    readIfPresent(node, "batch_size", cfg.batchSize);
    readIfPresent(node, "download_concurrency", cfg.downloadConcurrency);
    readIfPresent(node, "chunk_upload_attempts", cfg.chunkUploadAttempts);
    readIfPresent(node, "key_poll_attempts", cfg.keyPollAttempts);
    if (node["chunk_retry_interval_ms"])
      cfg.chunkRetryInterval = std::chrono::milliseconds(
          node["chunk_retry_interval_ms"].as<long long>());
    if (node["key_poll_interval_ms"])
      cfg.keyPollInterval = std::chrono::milliseconds(
          node["key_poll_interval_ms"].as<long long>());
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Invalid transfer section in " + path + ": " +
                             e.what());
  }
  if (cfg.chunkSize == 0 || cfg.batchSize == 0 || cfg.downloadConcurrency == 0)
    throw std::runtime_error("chunk_size, batch_size and download_concurrency "
                             "must be positive");
  return cfg;
}

} // namespace quickshare
