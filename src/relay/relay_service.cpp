#include "relay/relay_service.hpp"

#include "crypto/chunk_cipher.hpp"
#include "crypto/key_envelope.hpp"
#include "relay/wire_format.hpp"
#include "utilities/logger.h"
#include "utilities/relay_error.hpp"

#include <utility>

namespace quickshare::relay {

namespace {

const char *const kComponent = "relay";
const char *const kKeyName = "key";
const char *const kInfoName = "info";

std::string joinIndices(const std::vector<std::string> &keys, std::size_t max) {
  std::string out;
  for (std::size_t i = 0; i < keys.size() && i < max; ++i) {
    if (!out.empty())
      out += ",";
    out += keys[i];
  }
  if (keys.size() > max)
    out += ",...";
  return out;
}

std::size_t expectedChunkCount(std::uint64_t fileSize, std::size_t chunkSize) {
  if (fileSize == 0)
    return 1;
  return static_cast<std::size_t>((fileSize + chunkSize - 1) / chunkSize);
}

} // namespace

RelayService::RelayService(PickupCodeRegistry &registry, RelayStore &store,
                           Limits limits)
    : registry_(registry), store_(store), limits_(limits) {}

CreateCodeResult RelayService::createCode(const CreateCodeRequest &request) {
  return registry_.createCode(request);
}

void RelayService::storeEncryptedKey(const std::string &lookupCode,
                                     const std::string &ownerId,
                                     std::vector<std::byte> wrappedKey) {
  const CodeRecord code = registry_.requireOwner(lookupCode, ownerId);
  if (wrappedKey.size() != crypto::WRAPPED_KEY_BYTES) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Wrapped key must be " +
                         std::to_string(crypto::WRAPPED_KEY_BYTES) + " bytes");
  }
  if (!store_.put(lookupCode, ArtifactKind::WrappedKey, kKeyName,
                  std::move(wrappedKey), ownerId, code.expiresAt)) {
    throw RelayError(ErrorCode::CodeExpired, "Code " + lookupCode + " has expired");
  }
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Stored wrapped key for " + lookupCode);
}

std::string RelayService::uploadChunk(const std::string &lookupCode,
                                      const std::string &ownerId,
                                      std::size_t index,
                                      std::vector<std::byte> data) {
  const CodeRecord code = registry_.requireOwner(lookupCode, ownerId);
  if (code.reused || code.status != CodeStatus::Waiting) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Code " + lookupCode + " is not accepting chunks");
  }
  if (data.size() < crypto::SEAL_OVERHEAD || data.size() > limits_.maxChunkBytes) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Chunk " + std::to_string(index) + " has invalid size " +
                         std::to_string(data.size()));
  }
  // Every chunk but an empty file's single chunk carries at least one byte,
  // so no upload of the declared size can have more chunks than this.
  if (index >= expectedChunkCount(code.fileSize, 1)) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Chunk index " + std::to_string(index) + " out of range");
  }
  const std::string key = std::to_string(index);
  if (!store_.put(code.storageCode, ArtifactKind::Chunk, key, std::move(data),
                  ownerId, code.expiresAt)) {
    throw RelayError(ErrorCode::CodeExpired, "Code " + lookupCode + " has expired");
  }
  auto stored = store_.get(code.storageCode, ArtifactKind::Chunk, key);
  if (!stored) {
    throw RelayError(ErrorCode::Internal,
                     "Chunk " + key + " of " + lookupCode + " was not retained");
  }
  Logger::getInstance().log(LogLevel::TRACE, kComponent,
                            "Stored chunk " + key + " of " + lookupCode);
  return crypto::digestHex(*stored);
}

void RelayService::uploadComplete(const std::string &lookupCode,
                                  const std::string &ownerId,
                                  const UploadManifest &manifest) {
  const CodeRecord code = registry_.requireOwner(lookupCode, ownerId);
  if (code.reused) {
    registry_.markUploadComplete(lookupCode, ownerId, manifest);
    return;
  }
  if (manifest.totalChunks == 0) {
    throw RelayError(ErrorCode::InvalidRequest, "Manifest has no chunks");
  }
  if (manifest.chunkSize > 0 &&
      manifest.totalChunks !=
          expectedChunkCount(manifest.fileSize, manifest.chunkSize)) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Chunk count does not match file and chunk size");
  }
  std::vector<std::string> keys;
  keys.reserve(manifest.totalChunks);
  for (std::size_t i = 0; i < manifest.totalChunks; ++i) {
    keys.push_back(std::to_string(i));
  }
  BatchResult present = store_.getBatch(code.storageCode, ArtifactKind::Chunk, keys);
  if (!present.missing.empty() || !present.expired.empty()) {
    std::vector<std::string> gaps = present.missing;
    gaps.insert(gaps.end(), present.expired.begin(), present.expired.end());
    Logger::getInstance().log(LogLevel::WARN, kComponent,
                              "Upload of " + lookupCode + " incomplete, missing " +
                                  std::to_string(gaps.size()) + " chunks");
    throw RelayError(ErrorCode::UploadFailed,
                     "Missing chunks: " + joinIndices(gaps, 10));
  }
  const std::size_t total = manifest.totalChunks;
  const std::size_t extra = store_.evictUnless(
      code.storageCode, ArtifactKind::Chunk, [total](const std::string &key) {
        return std::stoull(key) < total;
      });
  if (extra > 0) {
    Logger::getInstance().log(LogLevel::WARN, kComponent,
                              "Dropped " + std::to_string(extra) +
                                  " chunks past the manifest of " + lookupCode);
  }

  FileInfo info;
  info.fileName = code.fileName;
  info.fileSize = manifest.fileSize;
  info.mimeType = code.mimeType;
  info.totalChunks = manifest.totalChunks;
  info.chunkSize = manifest.chunkSize;
  const std::string encoded = nlohmann::json(info).dump();
  std::vector<std::byte> bytes(encoded.size());
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    bytes[i] = static_cast<std::byte>(encoded[i]);
  }
  if (!store_.put(code.storageCode, ArtifactKind::FileInfo, kInfoName,
                  std::move(bytes), ownerId, code.expiresAt)) {
    throw RelayError(ErrorCode::CodeExpired, "Code " + lookupCode + " has expired");
  }
  registry_.markUploadComplete(lookupCode, ownerId, manifest);
}

KeyFetch RelayService::fetchEncryptedKey(const std::string &lookupCode) {
  const CodeRecord code = registry_.checkAccess(lookupCode);
  auto wrapped =
      code.status == CodeStatus::Waiting
          ? nullptr
          : store_.get(lookupCode, ArtifactKind::WrappedKey, kKeyName);
  if (!wrapped) {
    throw RelayError(ErrorCode::KeyNotReady,
                     "Sender has not finished uploading " + lookupCode);
  }
  KeyFetch fetch;
  fetch.wrappedKey = *wrapped;
  fetch.sessionId = registry_.openSession(lookupCode);
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Key fetched for " + lookupCode);
  return fetch;
}

FileInfo RelayService::fetchFileInfo(const std::string &lookupCode) {
  const CodeRecord code = registry_.checkAccess(lookupCode);
  if (code.status == CodeStatus::Waiting) {
    throw RelayError(ErrorCode::KeyNotReady,
                     "Sender has not finished uploading " + lookupCode);
  }
  auto stored = store_.get(code.storageCode, ArtifactKind::FileInfo, kInfoName);
  if (!stored) {
    if (store_.expiryOf(code.storageCode, ArtifactKind::FileInfo, kInfoName)) {
      throw RelayError(ErrorCode::ChunkExpired,
                       "File info of " + lookupCode + " has expired");
    }
    throw RelayError(ErrorCode::Internal,
                     "File info of " + lookupCode + " is missing");
  }
  const std::string text(reinterpret_cast<const char *>(stored->data()),
                         stored->size());
  return parseBody<FileInfo>(text);
}

ChunkBatch RelayService::downloadChunks(const std::string &lookupCode,
                                        const std::vector<std::size_t> &indices,
                                        const std::string &sessionId) {
  const CodeRecord code = registry_.checkAccess(lookupCode);
  if (code.status == CodeStatus::Waiting) {
    throw RelayError(ErrorCode::KeyNotReady,
                     "Sender has not finished uploading " + lookupCode);
  }
  registry_.validateSession(lookupCode, sessionId);
  if (indices.empty() || indices.size() > limits_.maxBatchSize) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Batch must hold 1 to " +
                         std::to_string(limits_.maxBatchSize) + " indices");
  }
  std::vector<std::string> keys;
  keys.reserve(indices.size());
  for (auto index : indices) {
    if (index >= code.totalChunks) {
      throw RelayError(ErrorCode::InvalidRequest,
                       "Chunk index " + std::to_string(index) + " out of range");
    }
    keys.push_back(std::to_string(index));
  }
  BatchResult result = store_.getBatch(code.storageCode, ArtifactKind::Chunk, keys);
  ChunkBatch batch;
  for (auto &kv : result.found) {
    batch.chunks.emplace(std::stoul(kv.first), *kv.second);
  }
  for (const auto &k : result.missing) {
    batch.missing.push_back(std::stoul(k));
  }
  for (const auto &k : result.expired) {
    batch.expired.push_back(std::stoul(k));
  }
  Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                            "Served " + std::to_string(batch.chunks.size()) +
                                "/" + std::to_string(indices.size()) +
                                " chunks of " + lookupCode);
  return batch;
}

DownloadCompletion RelayService::downloadComplete(const std::string &lookupCode,
                                                  const std::string &sessionId) {
  return registry_.recordDownloadComplete(lookupCode, sessionId);
}

std::vector<std::string> RelayService::invalidateFile(const std::string &fileId,
                                                      const std::string &ownerId) {
  return registry_.invalidateFile(fileId, ownerId);
}

CodeStatusView RelayService::status(const std::string &lookupCode) {
  return registry_.status(lookupCode);
}

} // namespace quickshare::relay
