#ifndef QUICKSHARE_TRANSFER_ORCHESTRATOR_HPP
#define QUICKSHARE_TRANSFER_ORCHESTRATOR_HPP

#include "crypto/aead.hpp"
#include "relay/relay_types.hpp"
#include "transfer/byte_source.hpp"
#include "transfer/key_cache.hpp"
#include "transfer/relay_transport.hpp"
#include "utilities/config.hpp"
#include "utilities/retry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quickshare::transfer {

/// Cooperative cancellation, checked at every I/O boundary of a transfer.
class CancellationToken {
public:
  void cancel() { cancelled_ = true; }
  bool cancelled() const { return cancelled_; }
  /// @throw RelayError(TransferCancelled) once cancel() was called.
  void throwIfCancelled(const std::string &where) const;

private:
  std::atomic<bool> cancelled_{false};
};

enum class UploadState { Idle, Hashing, Slicing, Uploading, KeyWrapped, Complete, Failed };
enum class DownloadState {
  Idle,
  FetchingKey,
  FetchingMetadata,
  Downloading,
  Reassembling,
  Complete,
  Failed
};

const char *uploadStateName(UploadState state);
const char *downloadStateName(DownloadState state);

/// What to do when the relay reports the same content is already shared.
enum class DuplicatePolicy {
  Report,  ///< Return the conflict to the caller and stop.
  Reuse,   ///< Issue a new code over the stored chunks (needs the cached key).
  Replace  ///< Invalidate the earlier file and upload again.
};

struct UploadOptions {
  std::string fileName;
  std::string mimeType = "application/octet-stream";
  std::optional<unsigned int> usageLimit;
  std::optional<unsigned int> ttlHours;
  DuplicatePolicy onDuplicate = DuplicatePolicy::Report;
};

struct UploadResult {
  std::optional<relay::DuplicateConflict> duplicate;
  std::string pickupCode; ///< Full 12 character code; share out of band.
  std::string lookupCode;
  std::string fileId;
  std::int64_t expiresAt = 0;
  std::size_t totalChunks = 0;
  bool reused = false;
  std::string contentHash;
};

struct DownloadedFile {
  relay::FileInfo info;
  std::vector<std::byte> data;
  relay::DownloadCompletion completion;
};

using ProgressFn = std::function<void(std::size_t done, std::size_t total)>;
using SleepFn = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Sender side of one transfer.
 *
 * Hashes the source, asks for a lookup code, then encrypts and uploads chunks
 * in index order, confirming each stored digest before moving on. Only after
 * the last chunk is confirmed is the wrapped key stored and the upload
 * declared complete, so a receiver can never fetch a key for partial data.
 */
class UploadOrchestrator {
public:
  UploadOrchestrator(RelayTransport &transport, TransferConfig config,
                     KeyCache *keyCache = nullptr,
                     std::shared_ptr<CancellationToken> cancel = nullptr);

  /**
   * @brief Run the upload.
   *
   * With DuplicatePolicy::Report a duplicate is returned in
   * UploadResult::duplicate and the orchestrator goes back to Idle, so the
   * caller may call upload() again with another policy.
   *
   * @throw RelayError(UploadFailed) once chunk retries are exhausted,
   *        RelayError(DuplicateContent) when reuse is asked for but the
   *        content key is not cached, RelayError(TransferCancelled).
   */
  UploadResult upload(ByteSource &source, const UploadOptions &options);

  UploadState state() const { return state_; }
  void onProgress(ProgressFn fn) { progress_ = std::move(fn); }
  void setSleeper(SleepFn fn) { sleeper_ = std::move(fn); }

private:
  std::string hashSource(ByteSource &source);
  relay::CreateCodeResult requestCode(const relay::CreateCodeRequest &request);
  void uploadChunks(ByteSource &source, const std::string &lookupCode,
                    const crypto::Key &contentKey, std::size_t totalChunks);
  std::string publishKey(const std::string &lookupCode, const crypto::Key &contentKey);
  RetryPolicy chunkPolicy() const;
  void checkCancelled(const std::string &where) const;

  RelayTransport &transport_;
  TransferConfig config_;
  KeyCache *keyCache_;
  std::shared_ptr<CancellationToken> cancel_;
  std::atomic<UploadState> state_{UploadState::Idle};
  ProgressFn progress_;
  SleepFn sleeper_;
};

/**
 * @brief Receiver side of one transfer.
 *
 * Polls for the wrapped key, unwraps it with the key segment, then fetches
 * chunks in batches with a small fixed number of batches in flight. Chunks
 * are decrypted as they arrive; any authentication failure aborts the
 * transfer and no partial plaintext is returned.
 */
class DownloadOrchestrator {
public:
  DownloadOrchestrator(RelayTransport &transport, TransferConfig config,
                       std::shared_ptr<CancellationToken> cancel = nullptr);

  /**
   * @brief Download and decrypt the file named by @p pickupCode.
   * @throw RelayError(SenderNotFinished) after the key poll gives up,
   *        RelayError(KeyUnwrapError) for a wrong code, RelayError with the
   *        registry's reason for unusable codes, RelayError(ChunkAuthError),
   *        RelayError(ChunkMissing|ChunkExpired), RelayError(TransferCancelled).
   */
  DownloadedFile download(const std::string &pickupCode);

  DownloadState state() const { return state_; }
  void onProgress(ProgressFn fn) { progress_ = std::move(fn); }
  void setSleeper(SleepFn fn) { sleeper_ = std::move(fn); }

private:
  using DecryptedBatch = std::vector<std::pair<std::size_t, std::vector<std::byte>>>;

  DecryptedBatch fetchBatch(const std::string &lookupCode,
                            const std::vector<std::size_t> &indices,
                            const std::string &sessionId,
                            const crypto::Key &contentKey);
  RetryPolicy transientPolicy() const;
  void checkCancelled(const std::string &where) const;

  RelayTransport &transport_;
  TransferConfig config_;
  std::shared_ptr<CancellationToken> cancel_;
  std::atomic<DownloadState> state_{DownloadState::Idle};
  ProgressFn progress_;
  SleepFn sleeper_;
};

} // namespace quickshare::transfer

#endif // QUICKSHARE_TRANSFER_ORCHESTRATOR_HPP
