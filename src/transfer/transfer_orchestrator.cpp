#include "transfer/transfer_orchestrator.hpp"

#include "crypto/chunk_cipher.hpp"
#include "crypto/key_envelope.hpp"
#include "utilities/logger.h"
#include "utilities/pickup_code.hpp"
#include "utilities/relay_error.hpp"

#include <algorithm>
#include <deque>
#include <future>
#include <stdexcept>

namespace quickshare::transfer {

namespace {

const char *const kComponent = "transfer";

bool isTransient(const RelayError &e) {
  return e.code() == ErrorCode::TransportError || e.code() == ErrorCode::Internal;
}

bool isKeyNotReady(const RelayError &e) { return e.code() == ErrorCode::KeyNotReady; }

} // namespace

void CancellationToken::throwIfCancelled(const std::string &where) const {
  if (cancelled_) {
    throw RelayError(ErrorCode::TransferCancelled, "Transfer cancelled during " + where);
  }
}

const char *uploadStateName(UploadState state) {
  switch (state) {
  case UploadState::Idle:
    return "idle";
  case UploadState::Hashing:
    return "hashing";
  case UploadState::Slicing:
    return "slicing";
  case UploadState::Uploading:
    return "uploading";
  case UploadState::KeyWrapped:
    return "key_wrapped";
  case UploadState::Complete:
    return "complete";
  case UploadState::Failed:
    return "failed";
  }
  return "unknown";
}

const char *downloadStateName(DownloadState state) {
  switch (state) {
  case DownloadState::Idle:
    return "idle";
  case DownloadState::FetchingKey:
    return "fetching_key";
  case DownloadState::FetchingMetadata:
    return "fetching_metadata";
  case DownloadState::Downloading:
    return "downloading";
  case DownloadState::Reassembling:
    return "reassembling";
  case DownloadState::Complete:
    return "complete";
  case DownloadState::Failed:
    return "failed";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Upload

UploadOrchestrator::UploadOrchestrator(RelayTransport &transport, TransferConfig config,
                                       KeyCache *keyCache,
                                       std::shared_ptr<CancellationToken> cancel)
    : transport_(transport), config_(config), keyCache_(keyCache),
      cancel_(cancel ? std::move(cancel) : std::make_shared<CancellationToken>()) {}

void UploadOrchestrator::checkCancelled(const std::string &where) const {
  cancel_->throwIfCancelled(where);
}

RetryPolicy UploadOrchestrator::chunkPolicy() const {
  RetryPolicy policy;
  policy.maxAttempts = config_.chunkUploadAttempts;
  policy.interval = config_.chunkRetryInterval;
  policy.backoffMultiplier = 2.0;
  policy.sleeper = sleeper_;
  return policy;
}

std::string UploadOrchestrator::hashSource(ByteSource &source) {
  crypto::ContentHasher hasher;
  for (const auto &range : crypto::splitIntoChunks(source.size(), config_.chunkSize)) {
    checkCancelled("hashing");
    if (range.length > 0) {
      hasher.update(source.read(range.offset, range.length));
    }
  }
  return hasher.finalizeHex();
}

relay::CreateCodeResult
UploadOrchestrator::requestCode(const relay::CreateCodeRequest &request) {
  return retryWithPolicy(
      chunkPolicy(), [&] { return transport_.createCode(request); }, isTransient,
      ErrorCode::TransportError, "create code");
}

void UploadOrchestrator::uploadChunks(ByteSource &source, const std::string &lookupCode,
                                      const crypto::Key &contentKey,
                                      std::size_t totalChunks) {
  const auto slicer = crypto::splitIntoChunks(source.size(), config_.chunkSize);
  for (const auto &range : slicer) {
    checkCancelled("chunk upload");
    const std::vector<std::byte> plain = source.read(range.offset, range.length);
    const std::vector<std::byte> sealed = crypto::encryptChunk(plain, contentKey);
    const std::string expected = crypto::digestHex(sealed);
    retryWithPolicy(
        chunkPolicy(),
        [&] {
          checkCancelled("chunk upload");
          const std::string stored = transport_.uploadChunk(lookupCode, range.index, sealed);
          if (stored != expected) {
            throw RelayError(ErrorCode::TransportError,
                             "Digest mismatch for chunk " + std::to_string(range.index));
          }
        },
        isTransient, ErrorCode::UploadFailed,
        "upload chunk " + std::to_string(range.index) + " of " + lookupCode);
    if (progress_) {
      progress_(range.index + 1, totalChunks);
    }
  }
}

std::string UploadOrchestrator::publishKey(const std::string &lookupCode,
                                           const crypto::Key &contentKey) {
  const std::string keySegment = PickupCode::randomSegment();
  crypto::Key wrapping = crypto::deriveWrappingKey(keySegment);
  const std::vector<std::byte> wrapped = crypto::wrapKey(contentKey, wrapping);
  crypto::wipe(wrapping);
  checkCancelled("key upload");
  retryWithPolicy(
      chunkPolicy(), [&] { transport_.storeEncryptedKey(lookupCode, wrapped); },
      isTransient, ErrorCode::UploadFailed, "store key for " + lookupCode);
  return PickupCode::compose(lookupCode, keySegment).full();
}

UploadResult UploadOrchestrator::upload(ByteSource &source, const UploadOptions &options) {
  UploadState expectedIdle = UploadState::Idle;
  if (!state_.compare_exchange_strong(expectedIdle, UploadState::Hashing)) {
    throw std::logic_error(std::string("upload() called in state ") +
                           uploadStateName(expectedIdle));
  }

  crypto::Key contentKey{};
  try {
    UploadResult result;
    result.contentHash = hashSource(source);

    relay::CreateCodeRequest request;
    request.fileName = options.fileName;
    request.fileSize = source.size();
    request.mimeType = options.mimeType;
    request.contentHash = result.contentHash;
    request.usageLimit = options.usageLimit;
    request.ttlHours = options.ttlHours;

    relay::CreateCodeResult issued = requestCode(request);
    if (issued.conflict) {
      const relay::DuplicateConflict conflict = *issued.conflict;
      switch (options.onDuplicate) {
      case DuplicatePolicy::Report:
        Logger::getInstance().log(LogLevel::INFO, kComponent,
                                  "Content already shared as file " + conflict.fileId);
        result.duplicate = conflict;
        state_ = UploadState::Idle;
        return result;
      case DuplicatePolicy::Reuse: {
        if (!conflict.uploadComplete) {
          throw RelayError(ErrorCode::DuplicateContent,
                           "File " + conflict.fileId +
                               " is still uploading; invalidate it and upload again");
        }
        auto cached = keyCache_ ? keyCache_->get(result.contentHash) : std::nullopt;
        if (!cached) {
          throw RelayError(ErrorCode::DuplicateContent,
                           "Content key of file " + conflict.fileId +
                               " is not cached; invalidate and upload again");
        }
        contentKey = *cached;
        request.reuseFileId = conflict.fileId;
        issued = requestCode(request);
        if (issued.conflict) {
          throw RelayError(ErrorCode::DuplicateContent,
                           "Relay refused to reuse file " + conflict.fileId);
        }
        result.pickupCode = publishKey(issued.lookupCode, contentKey);
        state_ = UploadState::KeyWrapped;
        crypto::wipe(contentKey);
        result.lookupCode = issued.lookupCode;
        result.fileId = issued.fileId;
        result.expiresAt = issued.expiresAt;
        result.totalChunks = crypto::splitIntoChunks(source.size(), config_.chunkSize).count();
        result.reused = true;
        state_ = UploadState::Complete;
        Logger::getInstance().log(LogLevel::INFO, kComponent,
                                  "Reused file " + issued.fileId + " as " +
                                      issued.lookupCode);
        return result;
      }
      case DuplicatePolicy::Replace:
        transport_.invalidateFile(conflict.fileId);
        issued = requestCode(request);
        if (issued.conflict) {
          throw RelayError(ErrorCode::DuplicateContent,
                           "File " + conflict.fileId + " still conflicts after invalidation");
        }
        break;
      }
    }

    state_ = UploadState::Slicing;
    const auto slicer = crypto::splitIntoChunks(source.size(), config_.chunkSize);
    const std::size_t totalChunks = slicer.count();
    contentKey = crypto::generateContentKey();

    state_ = UploadState::Uploading;
    Logger::getInstance().log(LogLevel::INFO, kComponent,
                              "Uploading " + std::to_string(totalChunks) + " chunks to " +
                                  issued.lookupCode);
    uploadChunks(source, issued.lookupCode, contentKey, totalChunks);

    result.pickupCode = publishKey(issued.lookupCode, contentKey);
    state_ = UploadState::KeyWrapped;

    relay::UploadManifest manifest;
    manifest.totalChunks = totalChunks;
    manifest.fileSize = source.size();
    manifest.chunkSize = config_.chunkSize;
    checkCancelled("upload completion");
    retryWithPolicy(
        chunkPolicy(), [&] { transport_.uploadComplete(issued.lookupCode, manifest); },
        isTransient, ErrorCode::UploadFailed, "complete upload of " + issued.lookupCode);

    if (keyCache_) {
      keyCache_->put(result.contentHash, contentKey);
    }
    crypto::wipe(contentKey);

    result.lookupCode = issued.lookupCode;
    result.fileId = issued.fileId;
    result.expiresAt = issued.expiresAt;
    result.totalChunks = totalChunks;
    state_ = UploadState::Complete;
    Logger::getInstance().log(LogLevel::INFO, kComponent,
                              "Upload of " + issued.lookupCode + " complete");
    return result;
  } catch (...) {
    crypto::wipe(contentKey);
    state_ = UploadState::Failed;
    throw;
  }
}

// ---------------------------------------------------------------------------
// Download

DownloadOrchestrator::DownloadOrchestrator(RelayTransport &transport, TransferConfig config,
                                           std::shared_ptr<CancellationToken> cancel)
    : transport_(transport), config_(config),
      cancel_(cancel ? std::move(cancel) : std::make_shared<CancellationToken>()) {}

void DownloadOrchestrator::checkCancelled(const std::string &where) const {
  cancel_->throwIfCancelled(where);
}

RetryPolicy DownloadOrchestrator::transientPolicy() const {
  RetryPolicy policy;
  policy.maxAttempts = config_.chunkUploadAttempts;
  policy.interval = config_.chunkRetryInterval;
  policy.backoffMultiplier = 2.0;
  policy.sleeper = sleeper_;
  return policy;
}

DownloadOrchestrator::DecryptedBatch
DownloadOrchestrator::fetchBatch(const std::string &lookupCode,
                                 const std::vector<std::size_t> &indices,
                                 const std::string &sessionId,
                                 const crypto::Key &contentKey) {
  checkCancelled("chunk download");
  relay::ChunkBatch batch = retryWithPolicy(
      transientPolicy(),
      [&] { return transport_.downloadChunks(lookupCode, indices, sessionId); },
      isTransient, ErrorCode::TransportError, "download chunks of " + lookupCode);
  if (!batch.expired.empty()) {
    throw RelayError(ErrorCode::ChunkExpired,
                     "Chunk " + std::to_string(batch.expired.front()) + " of " +
                         lookupCode + " expired");
  }
  if (!batch.missing.empty()) {
    // One targeted re-fetch before giving up on the gap.
    checkCancelled("chunk download");
    relay::ChunkBatch again = transport_.downloadChunks(lookupCode, batch.missing, sessionId);
    if (!again.expired.empty()) {
      throw RelayError(ErrorCode::ChunkExpired,
                       "Chunk " + std::to_string(again.expired.front()) + " of " +
                           lookupCode + " expired");
    }
    for (auto &kv : again.chunks) {
      batch.chunks[kv.first] = std::move(kv.second);
    }
  }

  DecryptedBatch out;
  out.reserve(indices.size());
  for (auto index : indices) {
    auto it = batch.chunks.find(index);
    if (it == batch.chunks.end()) {
      throw RelayError(ErrorCode::ChunkMissing,
                       "Chunk " + std::to_string(index) + " of " + lookupCode + " is missing");
    }
    out.emplace_back(index, crypto::decryptChunk(it->second, contentKey));
  }
  return out;
}

DownloadedFile DownloadOrchestrator::download(const std::string &pickupCode) {
  DownloadState expectedIdle = DownloadState::Idle;
  if (!state_.compare_exchange_strong(expectedIdle, DownloadState::FetchingKey)) {
    throw std::logic_error(std::string("download() called in state ") +
                           downloadStateName(expectedIdle));
  }

  crypto::Key contentKey{};
  try {
    const PickupCode code = PickupCode::parse(pickupCode);
    const std::string &lookup = code.lookupSegment();

    RetryPolicy keyPoll;
    keyPoll.maxAttempts = config_.keyPollAttempts;
    keyPoll.interval = config_.keyPollInterval;
    keyPoll.sleeper = sleeper_;
    relay::KeyFetch fetch = retryWithPolicy(
        keyPoll,
        [&] {
          checkCancelled("key fetch");
          return transport_.fetchEncryptedKey(lookup);
        },
        isKeyNotReady, ErrorCode::SenderNotFinished, "fetch key for " + lookup);

    crypto::Key wrapping = crypto::deriveWrappingKey(code.keySegment());
    try {
      contentKey = crypto::unwrapKey(fetch.wrappedKey, wrapping);
    } catch (...) {
      crypto::wipe(wrapping);
      throw;
    }
    crypto::wipe(wrapping);

    state_ = DownloadState::FetchingMetadata;
    DownloadedFile file;
    file.info = retryWithPolicy(
        transientPolicy(), [&] { return transport_.fetchFileInfo(lookup); }, isTransient,
        ErrorCode::TransportError, "fetch file info for " + lookup);
    const std::size_t total = file.info.totalChunks;
    if (total == 0) {
      throw RelayError(ErrorCode::ChunkMissing, "File info of " + lookup + " lists no chunks");
    }

    state_ = DownloadState::Downloading;
    const std::size_t batchSize = std::max<std::size_t>(1, config_.batchSize);
    const std::size_t window = std::max<std::size_t>(1, config_.downloadConcurrency);
    std::vector<std::vector<std::size_t>> batches;
    for (std::size_t start = 0; start < total; start += batchSize) {
      std::vector<std::size_t> indices;
      for (std::size_t i = start; i < std::min(total, start + batchSize); ++i) {
        indices.push_back(i);
      }
      batches.push_back(std::move(indices));
    }
    Logger::getInstance().log(LogLevel::INFO, kComponent,
                              "Downloading " + std::to_string(total) + " chunks of " +
                                  lookup + " in " + std::to_string(batches.size()) +
                                  " batches (session " + fetch.sessionId + ")");

    std::vector<std::vector<std::byte>> plain(total);
    std::deque<std::future<DecryptedBatch>> inflight;
    std::size_t next = 0;
    std::size_t done = 0;
    while (next < batches.size() || !inflight.empty()) {
      while (inflight.size() < window && next < batches.size()) {
        checkCancelled("chunk download");
        inflight.push_back(std::async(std::launch::async,
                                      [this, &lookup, &fetch, &contentKey,
                                       indices = batches[next]] {
                                        return fetchBatch(lookup, indices,
                                                          fetch.sessionId, contentKey);
                                      }));
        ++next;
      }
      DecryptedBatch ready = inflight.front().get();
      inflight.pop_front();
      for (auto &entry : ready) {
        plain[entry.first] = std::move(entry.second);
      }
      done += ready.size();
      if (progress_) {
        progress_(done, total);
      }
    }

    state_ = DownloadState::Reassembling;
    std::uint64_t assembled = 0;
    for (const auto &chunk : plain) {
      assembled += chunk.size();
    }
    if (assembled != file.info.fileSize) {
      throw RelayError(ErrorCode::ChunkMissing,
                       "Reassembled " + std::to_string(assembled) + " bytes, expected " +
                           std::to_string(file.info.fileSize));
    }
    file.data.reserve(static_cast<std::size_t>(assembled));
    for (auto &chunk : plain) {
      file.data.insert(file.data.end(), chunk.begin(), chunk.end());
      chunk.clear();
    }
    crypto::wipe(contentKey);

    checkCancelled("download completion");
    file.completion = retryWithPolicy(
        transientPolicy(), [&] { return transport_.downloadComplete(lookup, fetch.sessionId); },
        isTransient, ErrorCode::TransportError, "complete download of " + lookup);
    state_ = DownloadState::Complete;
    Logger::getInstance().log(LogLevel::INFO, kComponent,
                              "Download of " + lookup + " complete (" +
                                  std::to_string(file.completion.usedCount) + "/" +
                                  std::to_string(file.completion.usageLimit) + ")");
    return file;
  } catch (...) {
    crypto::wipe(contentKey);
    state_ = DownloadState::Failed;
    throw;
  }
}

} // namespace quickshare::transfer
