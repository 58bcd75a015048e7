#include "transfer/byte_source.hpp"
#include "transfer/http_relay_transport.hpp"
#include "transfer/transfer_orchestrator.hpp"
#include "utilities/config.hpp"
#include "utilities/http.hpp"
#include "utilities/logger.h"
#include "utilities/relay_error.hpp"

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace quickshare;

namespace {

struct CliOptions {
  std::string server = "127.0.0.1:8000";
  std::string token;
  std::optional<unsigned int> limit;
  std::optional<unsigned int> ttl;
  transfer::DuplicatePolicy onDuplicate = transfer::DuplicatePolicy::Report;
  std::vector<std::string> positional;
};

void usage() {
  std::cout << "Usage: quickshare send <file> [--server host:port] [--limit N] "
               "[--ttl HOURS] [--token JWT] [--reuse|--replace]\n"
            << "       quickshare receive <CODE> <output-dir> [--server host:port]\n";
}

CliOptions parseArgs(int argc, char **argv) {
  CliOptions opts;
  if (const char *env = std::getenv("QUICKSHARE_SERVER"))
    opts.server = env;
  if (const char *env = std::getenv("QUICKSHARE_TOKEN"))
    opts.token = env;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--server" && i + 1 < argc) {
      opts.server = argv[++i];
    } else if (arg == "--token" && i + 1 < argc) {
      opts.token = argv[++i];
    } else if (arg == "--limit" && i + 1 < argc) {
      opts.limit = static_cast<unsigned int>(std::stoul(argv[++i]));
    } else if (arg == "--ttl" && i + 1 < argc) {
      opts.ttl = static_cast<unsigned int>(std::stoul(argv[++i]));
    } else if (arg == "--reuse") {
      opts.onDuplicate = transfer::DuplicatePolicy::Reuse;
    } else if (arg == "--replace") {
      opts.onDuplicate = transfer::DuplicatePolicy::Replace;
    } else {
      opts.positional.push_back(arg);
    }
  }
  return opts;
}

std::string formatTime(std::int64_t unixSeconds) {
  std::time_t t = static_cast<std::time_t>(unixSeconds);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M UTC", &utc);
  return buf;
}

int sendCommand(const CliOptions &opts, const TransferConfig &cfg) {
  if (opts.positional.size() != 1) {
    usage();
    return 1;
  }
  const std::string path = opts.positional[0];
  auto transport = transfer::HttpRelayTransport::fromAddress(opts.server, opts.token);
  transfer::FileByteSource source(path);
  transfer::UploadOptions upload;
  upload.fileName = std::filesystem::path(path).filename().string();
  upload.mimeType = HTTP::GetMimeType(upload.fileName);
  upload.usageLimit = opts.limit;
  upload.ttlHours = opts.ttl;
  upload.onDuplicate = opts.onDuplicate;

  // The key cache only lives for this process, so --reuse can succeed only
  // when the relay-side file was uploaded by the same invocation.
  transfer::KeyCache cache;
  transfer::UploadOrchestrator orchestrator(transport, cfg, &cache);
  orchestrator.onProgress([](std::size_t done, std::size_t total) {
    std::cerr << "\rUploading " << done << "/" << total << std::flush;
  });
  transfer::UploadResult result = orchestrator.upload(source, upload);
  std::cerr << std::endl;
  if (result.duplicate) {
    std::cout << "This file is already shared (file " << result.duplicate->fileId
              << ", code " << result.duplicate->lookupCode << "...).\n"
              << "Run again with --replace to invalidate it and upload anew." << std::endl;
    return 2;
  }
  std::cout << "Pickup code: " << result.pickupCode << "\n"
            << "Expires:     " << formatTime(result.expiresAt) << std::endl;
  return 0;
}

int receiveCommand(const CliOptions &opts, const TransferConfig &cfg) {
  if (opts.positional.size() != 2) {
    usage();
    return 1;
  }
  auto transport = transfer::HttpRelayTransport::fromAddress(opts.server, opts.token);
  transfer::DownloadOrchestrator orchestrator(transport, cfg);
  orchestrator.onProgress([](std::size_t done, std::size_t total) {
    std::cerr << "\rDownloading " << done << "/" << total << std::flush;
  });
  transfer::DownloadedFile file = orchestrator.download(opts.positional[0]);
  std::cerr << std::endl;

  // Only the base name is trusted; the sender controls the string.
  std::string name = std::filesystem::path(file.info.fileName).filename().string();
  if (name.empty() || name == "." || name == "..")
    name = "download.bin";
  std::filesystem::path out = std::filesystem::path(opts.positional[1]) / name;
  std::ofstream os(out, std::ios::binary | std::ios::trunc);
  if (!os) {
    std::cerr << "Cannot write " << out << std::endl;
    return 1;
  }
  os.write(reinterpret_cast<const char *>(file.data.data()),
           static_cast<std::streamsize>(file.data.size()));
  if (!os) {
    std::cerr << "Write to " << out << " failed" << std::endl;
    return 1;
  }
  std::cout << "Saved " << out.string() << " (" << file.data.size() << " bytes, download "
            << file.completion.usedCount << "/" << file.completion.usageLimit << ")"
            << std::endl;
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  const std::string cmd = argv[1];
  try {
    CliOptions opts = parseArgs(argc, argv);
    TransferConfig cfg = loadTransferConfig(configPath());
    if (cmd == "send")
      return sendCommand(opts, cfg);
    if (cmd == "receive")
      return receiveCommand(opts, cfg);
  } catch (const RelayError &e) {
    std::cerr << "Error (" << e.reason() << "): " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  usage();
  return 1;
}
