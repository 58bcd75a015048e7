#ifndef QUICKSHARE_KEY_CACHE_HPP
#define QUICKSHARE_KEY_CACHE_HPP

#include "crypto/aead.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace quickshare::transfer {

/**
 * @brief Sender-side content keys by whole-file SHA-256.
 *
 * Reusing an earlier upload needs the original content key, since the relay
 * only holds it wrapped under the earlier code. Keys are wiped on removal.
 */
class KeyCache {
public:
  KeyCache() = default;
  ~KeyCache();
  KeyCache(const KeyCache &) = delete;
  KeyCache &operator=(const KeyCache &) = delete;

  void put(const std::string &contentHash, const crypto::Key &key);
  std::optional<crypto::Key> get(const std::string &contentHash) const;
  void erase(const std::string &contentHash);
  void clear();
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, crypto::Key> keys_;
};

} // namespace quickshare::transfer

#endif // QUICKSHARE_KEY_CACHE_HPP
