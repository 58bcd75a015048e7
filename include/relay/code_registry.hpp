#ifndef QUICKSHARE_CODE_REGISTRY_HPP
#define QUICKSHARE_CODE_REGISTRY_HPP

#include "relay/relay_store.hpp"
#include "relay/relay_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quickshare::relay {

/// Per-code state. Several codes may share one stored file (reuse).
struct CodeRecord {
  std::string lookupCode;
  std::string fileId;
  std::string ownerId;
  std::string storageCode; ///< Lookup code the chunks and file-info live under.
  CodeStatus status = CodeStatus::Waiting;
  unsigned int usedCount = 0;
  unsigned int usageLimit = 0;
  TimePoint createdAt{};
  TimePoint expiresAt{};
  bool reused = false;
  bool keyReleased = false;
  std::deque<std::string> sessions; ///< Open download sessions, oldest first.
  // Snapshot of the owning file, filled in on copies handed to callers.
  std::string fileName;
  std::uint64_t fileSize = 0;
  std::string mimeType;
  std::size_t totalChunks = 0;
};

/// Per-file state shared by every code issued for the same content.
struct FileRecord {
  std::string fileId;
  std::string ownerId;
  std::string fileName;
  std::uint64_t fileSize = 0;
  std::string mimeType;
  std::size_t totalChunks = 0;
  std::size_t chunkSize = 0;
  std::string fingerprint;
  std::string storageCode;
  TimePoint createdAt{};
  TimePoint storageExpiresAt{};
  bool uploadComplete = false;
  bool invalidated = false;
  bool storageReleased = false;
  std::vector<std::string> codes;
};

/// What one owner sweep decided; the caller evicts the matching artifacts.
struct SweepReport {
  std::unordered_set<std::string> revokedKeyCodes;
  std::unordered_set<std::string> releasedStorageCodes;
  std::size_t expiredCodes = 0;
  std::size_t droppedRecords = 0;
};

/**
 * @brief Issues pickup codes and tracks their lifecycle.
 *
 * State is partitioned by owner; each partition has its own mutex, so work on
 * one owner's codes never waits on another owner's. A small index maps lookup
 * codes and file ids to their owner. Lock order is index before partition.
 *
 * Terminal codes stay queryable (as tombstones) until their expiry plus the
 * retention window so a late receiver still gets the precise reason.
 */
class PickupCodeRegistry {
public:
  struct Options {
    unsigned int defaultUsageLimit = 3;
    unsigned int maxUsageLimit = 100;
    std::chrono::hours defaultTtl{24};
    std::chrono::hours maxTtl{168};
    std::string pepper = "quick-share-default-pepper";
    std::chrono::hours tombstoneRetention{24};
    int codeGenerationAttempts = 100;
    /// Open sessions kept per code; the oldest is dropped beyond this.
    std::size_t maxSessionsPerCode = 32;
  };

  explicit PickupCodeRegistry(Options options,
                              NowFn now = [] { return Clock::now(); });

  PickupCodeRegistry(const PickupCodeRegistry &) = delete;
  PickupCodeRegistry &operator=(const PickupCodeRegistry &) = delete;

  /**
   * @brief Issue a new lookup code, or report a duplicate.
   *
   * With a content hash and no reuseFileId, any live upload of the same
   * content by the same owner, finished or not, is returned as a conflict
   * instead of a code. With reuseFileId the new code points at that file's
   * stored chunks; its expiry is capped at the chunks' expiry.
   *
   * @throw RelayError(InvalidRequest) on out-of-range limits or a bad hash.
   * @throw RelayError(CodeNotFound) if reuseFileId names no stored file.
   */
  CreateCodeResult createCode(const CreateCodeRequest &request);

  /**
   * @brief Resolve a lookup code that is still usable.
   * @throw RelayError(CodeNotFound|CodeExpired|CodeCompleted|CodeInvalidated)
   */
  CodeRecord checkAccess(const std::string &lookupCode);

  /// checkAccess() plus an ownership check (RelayError(Forbidden)).
  CodeRecord requireOwner(const std::string &lookupCode,
                          const std::string &ownerId);

  /// Public view of any known code, terminal ones included.
  CodeStatusView status(const std::string &lookupCode);

  /**
   * @brief Record that every chunk of the code's file is stored.
   * @throw RelayError(InvalidRequest) if the manifest contradicts the
   *        declared file size.
   */
  void markUploadComplete(const std::string &lookupCode,
                          const std::string &ownerId,
                          const UploadManifest &manifest);

  /// Start a download session after a successful key fetch.
  std::string openSession(const std::string &lookupCode);

  /**
   * @brief Validate an optional session id for @p lookupCode.
   * @throw RelayError(InvalidRequest) if it is set but unknown.
   */
  void validateSession(const std::string &lookupCode,
                       const std::string &sessionId);

  /**
   * @brief Count one finished download; the code completes at its limit.
   * @throw RelayError for terminal codes, and KeyNotReady while the upload
   *        is still in progress.
   */
  DownloadCompletion recordDownloadComplete(const std::string &lookupCode,
                                            const std::string &sessionId);

  /**
   * @brief Invalidate a file and every code pointing at it.
   * @return Lookup codes of the file.
   * @throw RelayError(CodeNotFound|Forbidden)
   */
  std::vector<std::string> invalidateFile(const std::string &fileId,
                                          const std::string &ownerId);

  /**
   * @brief Expire due codes of one owner and decide what may be evicted.
   *
   * Holds only that owner's partition lock while scanning.
   */
  SweepReport sweepOwner(const std::string &ownerId);

  /// Owners with at least one tracked code or file.
  std::vector<std::string> owners() const;

  /// Dedup fingerprint: HMAC-SHA256 keyed by the pepper over owner and hash.
  std::string fingerprint(const std::string &ownerId,
                          const std::string &contentHash) const;

private:
  struct Partition {
    std::mutex mutex;
    std::unordered_map<std::string, CodeRecord> codes;
    std::unordered_map<std::string, FileRecord> files;
    // fp -> every tracked file with that content
    std::unordered_map<std::string, std::set<std::string>> fingerprints;
  };

  std::shared_ptr<Partition> partitionForCode(const std::string &lookupCode) const;
  std::shared_ptr<Partition> partitionForOwner(const std::string &ownerId) const;

  // Caller holds the partition mutex.
  CodeRecord &liveCode(Partition &partition, const std::string &lookupCode);
  void applyExpiry(CodeRecord &code) const;
  CodeRecord snapshot(const Partition &partition, const CodeRecord &code) const;
  bool fileHasLiveCode(const Partition &partition, const FileRecord &file) const;
  std::optional<DuplicateConflict> findDuplicate(const Partition &partition,
                                                 const std::string &fp,
                                                 TimePoint now) const;
  static void forgetFingerprint(Partition &partition, const FileRecord &file);

  std::string allocateLookupCode() const; // caller holds index_ exclusively
  static std::string newFileId();

  Options options_;
  NowFn now_;

  mutable std::shared_mutex indexMutex_;
  std::unordered_map<std::string, std::shared_ptr<Partition>> partitions_;
  std::unordered_map<std::string, std::string> codeOwners_;
  std::unordered_map<std::string, std::string> fileOwners_;
};

} // namespace quickshare::relay

#endif // QUICKSHARE_CODE_REGISTRY_HPP
