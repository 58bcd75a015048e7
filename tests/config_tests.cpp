#include "utilities/config.hpp"
#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = (fs::path(quickshare::getVarDir()) / "config_test.yaml").string();
    unsetenv("QUICKSHARE_PORT");
    unsetenv("QUICKSHARE_JWT_SECRET");
    unsetenv("QUICKSHARE_DEDUPE_PEPPER");
    unsetenv("QUICKSHARE_LOG_LEVEL");
  }
  void TearDown() override {
    fs::remove(path_);
    unsetenv("QUICKSHARE_PORT");
    unsetenv("QUICKSHARE_JWT_SECRET");
  }
  void write(const std::string &yaml) {
    std::ofstream out(path_);
    out << yaml;
  }

  std::string path_;
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
  auto cfg = quickshare::loadRelayConfig(path_ + ".absent");
  EXPECT_EQ(cfg.listenPort, 8000);
  EXPECT_EQ(cfg.defaultUsageLimit, 3u);
  EXPECT_EQ(cfg.defaultTtlHours, 24u);
  EXPECT_EQ(cfg.maxChunkBytes, 1024u * 1024u + 28u);
  EXPECT_EQ(cfg.effectivePepper(), "quick-share-default-pepper");
}

TEST_F(ConfigTest, ReadsRelaySettings) {
  write("listen_port: 9100\n"
        "jwt_secret: s3cret\n"
        "cleanup_interval_seconds: 15\n"
        "default_usage_limit: 5\n"
        "max_ttl_hours: 72\n"
        "log_level: DEBUG\n");
  auto cfg = quickshare::loadRelayConfig(path_);
  EXPECT_EQ(cfg.listenPort, 9100);
  EXPECT_EQ(cfg.jwtSecret, "s3cret");
  EXPECT_EQ(cfg.cleanupInterval, std::chrono::seconds(15));
  EXPECT_EQ(cfg.defaultUsageLimit, 5u);
  EXPECT_EQ(cfg.maxTtlHours, 72u);
  EXPECT_EQ(cfg.logLevel, "DEBUG");
  // No explicit pepper: the JWT secret stands in.
  EXPECT_EQ(cfg.effectivePepper(), "s3cret");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  write("listen_port: 9100\njwt_secret: from-file\n");
  setenv("QUICKSHARE_PORT", "9200", 1);
  setenv("QUICKSHARE_JWT_SECRET", "from-env", 1);
  auto cfg = quickshare::loadRelayConfig(path_);
  EXPECT_EQ(cfg.listenPort, 9200);
  EXPECT_EQ(cfg.jwtSecret, "from-env");
}

TEST_F(ConfigTest, RejectsInconsistentLimits) {
  write("default_usage_limit: 50\nmax_usage_limit: 10\n");
  EXPECT_THROW(quickshare::loadRelayConfig(path_), std::runtime_error);
}

TEST_F(ConfigTest, RejectsMalformedValues) {
  write("listen_port: not-a-number\n");
  EXPECT_THROW(quickshare::loadRelayConfig(path_), std::runtime_error);
  write("listen_port: [unterminated\n");
  EXPECT_THROW(quickshare::loadRelayConfig(path_), std::runtime_error);
}

TEST_F(ConfigTest, TransferSection) {
  write("transfer:\n"
        "  chunk_size: 1024\n"
        "  batch_size: 10\n"
        "  download_concurrency: 2\n"
        "  key_poll_interval_ms: 50\n");
  auto cfg = quickshare::loadTransferConfig(path_);
  EXPECT_EQ(cfg.chunkSize, 1024u);
  EXPECT_EQ(cfg.batchSize, 10u);
  EXPECT_EQ(cfg.downloadConcurrency, 2u);
  EXPECT_EQ(cfg.keyPollInterval, std::chrono::milliseconds(50));
  EXPECT_EQ(cfg.chunkUploadAttempts, 3);
}

TEST_F(ConfigTest, TransferDefaultsAndValidation) {
  write("listen_port: 9100\n");
  auto cfg = quickshare::loadTransferConfig(path_);
  EXPECT_EQ(cfg.chunkSize, 64u * 1024u);
  EXPECT_EQ(cfg.batchSize, 25u);
  EXPECT_EQ(cfg.downloadConcurrency, 3u);

  write("transfer:\n  batch_size: 0\n");
  EXPECT_THROW(quickshare::loadTransferConfig(path_), std::runtime_error);
}
