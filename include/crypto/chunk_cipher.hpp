#ifndef QUICKSHARE_CHUNK_CIPHER_HPP
#define QUICKSHARE_CHUNK_CIPHER_HPP

#include "crypto/aead.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <sodium.h>
#include <span>
#include <string>

namespace quickshare::crypto {

/** Byte range of one chunk inside the source file. */
struct ChunkRange {
  std::size_t index{0};
  std::uint64_t offset{0};
  std::size_t length{0};

  bool operator==(const ChunkRange &) const = default;
};

/**
 * @brief Lazy, restartable fixed-size slicing of a file.
 *
 * The slicer holds only the file size and chunk size, so iterating it twice
 * always yields the same boundaries. Every chunk is chunkSize bytes except the
 * last, which may be shorter. An empty file yields a single empty chunk so the
 * receiver still gets an authenticated (empty) payload.
 */
class ChunkSlicer {
public:
  class Iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = ChunkRange;
    using difference_type = std::ptrdiff_t;
    using pointer = const ChunkRange *;
    using reference = ChunkRange;

    Iterator() = default;
    Iterator(const ChunkSlicer *slicer, std::size_t index)
        : slicer_(slicer), index_(index) {}

    ChunkRange operator*() const { return slicer_->range(index_); }
    Iterator &operator++() {
      ++index_;
      return *this;
    }
    Iterator operator++(int) {
      Iterator tmp = *this;
      ++index_;
      return tmp;
    }
    bool operator==(const Iterator &other) const {
      return index_ == other.index_;
    }

  private:
    const ChunkSlicer *slicer_{nullptr};
    std::size_t index_{0};
  };

  /** @throw std::invalid_argument if @p chunkSize is zero. */
  ChunkSlicer(std::uint64_t fileSize, std::size_t chunkSize);

  std::size_t count() const { return count_; }
  std::uint64_t fileSize() const { return fileSize_; }
  std::size_t chunkSize() const { return chunkSize_; }

  /** @throw std::out_of_range if @p index >= count(). */
  ChunkRange range(std::size_t index) const;

  Iterator begin() const { return Iterator(this, 0); }
  Iterator end() const { return Iterator(this, count_); }

private:
  std::uint64_t fileSize_;
  std::size_t chunkSize_;
  std::size_t count_;
};

/** Slice a file of @p fileSize bytes into @p chunkSize pieces. */
ChunkSlicer splitIntoChunks(std::uint64_t fileSize, std::size_t chunkSize);

/**
 * @brief Encrypt one chunk under the content key.
 *
 * A fresh random nonce is drawn on every call; nonces are never derived from
 * the chunk index.
 *
 * @return nonce || ciphertext || tag
 */
Bytes encryptChunk(std::span<const std::byte> plain, const Key &contentKey);

/**
 * @brief Decrypt one chunk.
 * @throw RelayError(ChunkAuthError) on tampering, truncation, or a wrong key.
 */
Bytes decryptChunk(std::span<const std::byte> sealed, const Key &contentKey);

/** Lower-case hex SHA-256 of @p data. */
std::string digestHex(std::span<const std::byte> data);

/** Incremental SHA-256 over a whole file, used for the dedup content hash. */
class ContentHasher {
public:
  ContentHasher();
  void update(std::span<const std::byte> data);
  /** Lower-case hex digest. May be called only once. */
  std::string finalizeHex();

private:
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

} // namespace quickshare::crypto

#endif // QUICKSHARE_CHUNK_CIPHER_HPP
