#ifndef QUICKSHARE_RELAY_TYPES_HPP
#define QUICKSHARE_RELAY_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quickshare::relay {

/// Lifecycle of a pickup code. The last three are terminal.
enum class CodeStatus { Waiting, Transferring, Completed, Expired, Invalidated };

const char *codeStatusName(CodeStatus status);
CodeStatus codeStatusFromName(const std::string &name);

inline bool isTerminal(CodeStatus status) {
  return status == CodeStatus::Completed || status == CodeStatus::Expired ||
         status == CodeStatus::Invalidated;
}

/// Sender's request for a new pickup code.
struct CreateCodeRequest {
  std::string ownerId; ///< Filled in by the relay from the caller's identity.
  std::string fileName;
  std::uint64_t fileSize = 0;
  std::string mimeType;
  std::optional<std::string> contentHash; ///< Hex SHA-256 of the plaintext.
  std::optional<unsigned int> usageLimit;
  std::optional<unsigned int> ttlHours;
  std::optional<std::string> reuseFileId;
};

/// An earlier, still live upload of the same content by the same owner.
struct DuplicateConflict {
  std::string fileId;
  std::string lookupCode;
  std::int64_t expiresAt = 0;
  /// False while the earlier upload is still in progress; only a finished
  /// upload can be reused, an unfinished one can only be invalidated.
  bool uploadComplete = true;
};

/**
 * @brief Outcome of createCode().
 *
 * Exactly one of `conflict` or the issued-code fields is meaningful.
 */
struct CreateCodeResult {
  std::optional<DuplicateConflict> conflict;
  std::string lookupCode;
  std::string fileId;
  std::int64_t expiresAt = 0; ///< Unix seconds.
  unsigned int usageLimit = 0;
  bool reused = false; ///< Chunks already stored; skip straight to key upload.
};

/// Sent by the sender once every chunk is stored.
struct UploadManifest {
  std::size_t totalChunks = 0;
  std::uint64_t fileSize = 0;
  std::size_t chunkSize = 0;
};

/// Plaintext metadata the receiver needs to reassemble the file.
struct FileInfo {
  std::string fileName;
  std::uint64_t fileSize = 0;
  std::string mimeType;
  std::size_t totalChunks = 0;
  std::size_t chunkSize = 0;
};

/// Wrapped key plus the download session it opened.
struct KeyFetch {
  std::vector<std::byte> wrappedKey;
  std::string sessionId;
};

/// Chunks returned by one batched download call, keyed by index.
struct ChunkBatch {
  std::map<std::size_t, std::vector<std::byte>> chunks;
  std::vector<std::size_t> missing;
  std::vector<std::size_t> expired;
};

struct DownloadCompletion {
  unsigned int usedCount = 0;
  unsigned int usageLimit = 0;
  CodeStatus status = CodeStatus::Transferring;
};

/// Public view of a pickup code, without any key material.
struct CodeStatusView {
  std::string lookupCode;
  std::string fileId;
  CodeStatus status = CodeStatus::Waiting;
  unsigned int usedCount = 0;
  unsigned int usageLimit = 0;
  std::int64_t createdAt = 0;
  std::int64_t expiresAt = 0;
  std::string fileName;
  std::uint64_t fileSize = 0;
  std::size_t totalChunks = 0;
};

inline std::int64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
      .count();
}

inline std::chrono::system_clock::time_point fromUnixSeconds(std::int64_t s) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(s));
}

} // namespace quickshare::relay

#endif // QUICKSHARE_RELAY_TYPES_HPP
