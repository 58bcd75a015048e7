#include "relay/relay_store.hpp"

#include "utilities/logger.h"

#include <utility>

namespace quickshare::relay {

const char *artifactKindName(ArtifactKind kind) {
  switch (kind) {
  case ArtifactKind::Chunk:
    return "chunk";
  case ArtifactKind::FileInfo:
    return "file_info";
  case ArtifactKind::WrappedKey:
    return "encrypted_key";
  }
  return "unknown";
}

RelayStore::RelayStore(NowFn now) : now_(std::move(now)) {}

std::string RelayStore::entryKey(const std::string &lookupCode,
                                 ArtifactKind kind, const std::string &key) {
  // Lookup codes are [A-Z0-9], so ':' cannot appear inside a segment.
  std::string k;
  k.reserve(lookupCode.size() + key.size() + 16);
  k.append(lookupCode).append(":").append(artifactKindName(kind)).append(":");
  k.append(key);
  return k;
}

RelayStore::Shard &RelayStore::shardFor(const std::string &entryKey) {
  return shards_[std::hash<std::string>{}(entryKey) % SHARD_COUNT];
}

const RelayStore::Shard &
RelayStore::shardFor(const std::string &entryKey) const {
  return shards_[std::hash<std::string>{}(entryKey) % SHARD_COUNT];
}

bool RelayStore::put(const std::string &lookupCode, ArtifactKind kind,
                     const std::string &key, Bytes value,
                     const std::string &ownerId, TimePoint expiresAt) {
  if (expiresAt <= now_()) {
    Logger::getInstance().log(LogLevel::WARN, "relay_store",
                              std::string("Refusing to store already expired ") +
                                  artifactKindName(kind) + " for " +
                                  lookupCode + "/" + key);
    return false;
  }
  const std::string k = entryKey(lookupCode, kind, key);
  Entry entry{std::make_shared<const Bytes>(std::move(value)), ownerId,
              lookupCode, kind, expiresAt};
  Shard &shard = shardFor(k);
  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.entries[k] = std::move(entry);
  return true;
}

std::shared_ptr<const Bytes> RelayStore::get(const std::string &lookupCode,
                                             ArtifactKind kind,
                                             const std::string &key) const {
  const std::string k = entryKey(lookupCode, kind, key);
  const Shard &shard = shardFor(k);
  const TimePoint now = now_();
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(k);
  if (it == shard.entries.end() || it->second.expiresAt <= now) {
    return nullptr;
  }
  return it->second.value;
}

bool RelayStore::exists(const std::string &lookupCode, ArtifactKind kind,
                        const std::string &key) const {
  return get(lookupCode, kind, key) != nullptr;
}

std::optional<TimePoint> RelayStore::expiryOf(const std::string &lookupCode,
                                              ArtifactKind kind,
                                              const std::string &key) const {
  const std::string k = entryKey(lookupCode, kind, key);
  const Shard &shard = shardFor(k);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(k);
  if (it == shard.entries.end()) {
    return std::nullopt;
  }
  return it->second.expiresAt;
}

BatchResult RelayStore::getBatch(const std::string &lookupCode,
                                 ArtifactKind kind,
                                 const std::vector<std::string> &keys) const {
  BatchResult result;
  const TimePoint now = now_();
  for (const auto &key : keys) {
    const std::string k = entryKey(lookupCode, kind, key);
    const Shard &shard = shardFor(k);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(k);
    if (it == shard.entries.end()) {
      result.missing.push_back(key);
    } else if (it->second.expiresAt <= now) {
      result.expired.push_back(key);
    } else {
      result.found.emplace(key, it->second.value);
    }
  }
  return result;
}

std::size_t RelayStore::evictExpiredFor(const std::string &ownerId) {
  std::size_t removed = 0;
  const TimePoint now = now_();
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto it = shard.entries.begin(); it != shard.entries.end();) {
      if (it->second.ownerId == ownerId && it->second.expiresAt <= now) {
        it = shard.entries.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  if (removed > 0) {
    Logger::getInstance().log(LogLevel::DEBUG, "relay_store",
                              "Evicted " + std::to_string(removed) +
                                  " expired artifacts for owner " + ownerId);
  }
  return removed;
}

std::size_t
RelayStore::evictCodesFor(const std::string &ownerId,
                          const std::unordered_set<std::string> &lookupCodes,
                          std::optional<ArtifactKind> onlyKind) {
  if (lookupCodes.empty()) {
    return 0;
  }
  std::size_t removed = 0;
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto it = shard.entries.begin(); it != shard.entries.end();) {
      const Entry &e = it->second;
      if (e.ownerId == ownerId && lookupCodes.count(e.lookupCode) > 0 &&
          (!onlyKind || *onlyKind == e.kind)) {
        it = shard.entries.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  return removed;
}

std::size_t
RelayStore::evictUnless(const std::string &lookupCode, ArtifactKind kind,
                        const std::function<bool(const std::string &)> &keep) {
  const std::string prefix = entryKey(lookupCode, kind, "");
  std::size_t removed = 0;
  for (auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto it = shard.entries.begin(); it != shard.entries.end();) {
      if (it->first.compare(0, prefix.size(), prefix) == 0 &&
          !keep(it->first.substr(prefix.size()))) {
        it = shard.entries.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  return removed;
}

std::set<std::string> RelayStore::owners() const {
  std::set<std::string> result;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto &kv : shard.entries) {
      result.insert(kv.second.ownerId);
    }
  }
  return result;
}

std::size_t RelayStore::size() const {
  std::size_t total = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    total += shard.entries.size();
  }
  return total;
}

std::size_t RelayStore::bytesFor(const std::string &ownerId) const {
  std::size_t total = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto &kv : shard.entries) {
      if (kv.second.ownerId == ownerId) {
        total += kv.second.value->size();
      }
    }
  }
  return total;
}

} // namespace quickshare::relay
