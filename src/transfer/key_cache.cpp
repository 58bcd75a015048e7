#include "transfer/key_cache.hpp"

namespace quickshare::transfer {

KeyCache::~KeyCache() { clear(); }

void KeyCache::put(const std::string &contentHash, const crypto::Key &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(contentHash);
  if (it != keys_.end()) {
    crypto::wipe(it->second);
  }
  keys_[contentHash] = key;
}

std::optional<crypto::Key> KeyCache::get(const std::string &contentHash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(contentHash);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void KeyCache::erase(const std::string &contentHash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(contentHash);
  if (it != keys_.end()) {
    crypto::wipe(it->second);
    keys_.erase(it);
  }
}

void KeyCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &kv : keys_) {
    crypto::wipe(kv.second);
  }
  keys_.clear();
}

std::size_t KeyCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

} // namespace quickshare::transfer
