#ifndef QUICKSHARE_RELAY_STORE_HPP
#define QUICKSHARE_RELAY_STORE_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace quickshare::relay {

using Bytes = std::vector<std::byte>;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;

/** The three artifact families held for a lookup code. */
enum class ArtifactKind { Chunk, FileInfo, WrappedKey };

const char *artifactKindName(ArtifactKind kind);

/**
 * @brief Result of a batch read.
 *
 * `missing` means the artifact never existed or was already evicted;
 * `expired` means it is still present but past its expiry and about to be
 * reaped. Callers treat both as failures with different diagnostics.
 */
struct BatchResult {
  std::map<std::string, std::shared_ptr<const Bytes>> found;
  std::vector<std::string> missing;
  std::vector<std::string> expired;
};

/**
 * @brief Short-lived, multi-tenant storage for encrypted relay artifacts.
 *
 * Every artifact is addressed by (lookupCode, kind, key) and tagged with its
 * owner and an absolute expiry. Values are immutable once stored, so readers
 * share them without copying. Entries are spread across independently locked
 * shards; there is no lock covering the whole store, and eviction for one
 * owner only ever holds one shard lock at a time.
 */
class RelayStore {
public:
  static constexpr std::size_t SHARD_COUNT = 64;

  explicit RelayStore(NowFn now = [] { return Clock::now(); });

  RelayStore(const RelayStore &) = delete;
  RelayStore &operator=(const RelayStore &) = delete;

  /**
   * @brief Insert or overwrite an artifact.
   *
   * The stored expiry is exactly @p expiresAt; overwriting never extends the
   * lifetime implicitly.
   *
   * @return false (and nothing is stored) if @p expiresAt is not in the future.
   */
  bool put(const std::string &lookupCode, ArtifactKind kind,
           const std::string &key, Bytes value, const std::string &ownerId,
           TimePoint expiresAt);

  /** Fetch a live artifact; nullptr if absent or past expiry. */
  std::shared_ptr<const Bytes> get(const std::string &lookupCode,
                                   ArtifactKind kind,
                                   const std::string &key) const;

  /** True if a live artifact exists. */
  bool exists(const std::string &lookupCode, ArtifactKind kind,
              const std::string &key) const;

  /** Expiry of a stored artifact (live or not). */
  std::optional<TimePoint> expiryOf(const std::string &lookupCode,
                                    ArtifactKind kind,
                                    const std::string &key) const;

  /** Read many keys of one kind, partitioned into found/missing/expired. */
  BatchResult getBatch(const std::string &lookupCode, ArtifactKind kind,
                       const std::vector<std::string> &keys) const;

  /**
   * @brief Remove every artifact of @p ownerId whose expiry has passed.
   *
   * Artifacts of any other owner are never touched.
   * @return Number of artifacts removed.
   */
  std::size_t evictExpiredFor(const std::string &ownerId);

  /**
   * @brief Remove artifacts of @p ownerId under the given lookup codes,
   * regardless of expiry.
   * @param onlyKind Restrict removal to a single artifact kind.
   * @return Number of artifacts removed.
   */
  std::size_t evictCodesFor(const std::string &ownerId,
                            const std::unordered_set<std::string> &lookupCodes,
                            std::optional<ArtifactKind> onlyKind = std::nullopt);

  /**
   * @brief Remove artifacts of one kind under @p lookupCode whose key is
   * rejected by @p keep.
   * @return Number of artifacts removed.
   */
  std::size_t evictUnless(const std::string &lookupCode, ArtifactKind kind,
                          const std::function<bool(const std::string &)> &keep);

  /** Owners that currently hold at least one artifact. */
  std::set<std::string> owners() const;

  /** Number of stored artifacts (including expired, not yet evicted). */
  std::size_t size() const;

  /** Total payload bytes held for @p ownerId. */
  std::size_t bytesFor(const std::string &ownerId) const;

private:
  struct Entry {
    std::shared_ptr<const Bytes> value;
    std::string ownerId;
    std::string lookupCode;
    ArtifactKind kind;
    TimePoint expiresAt;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
  };

  static std::string entryKey(const std::string &lookupCode, ArtifactKind kind,
                              const std::string &key);
  Shard &shardFor(const std::string &entryKey);
  const Shard &shardFor(const std::string &entryKey) const;

  NowFn now_;
  std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace quickshare::relay

#endif // QUICKSHARE_RELAY_STORE_HPP
