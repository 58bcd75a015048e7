#include "crypto/chunk_cipher.hpp"

#include "utilities/relay_error.hpp"

#include <array>
#include <cppcodec/hex_lower.hpp>
#include <stdexcept>
#include <utility>

namespace quickshare::crypto {

ChunkSlicer::ChunkSlicer(std::uint64_t fileSize, std::size_t chunkSize)
    : fileSize_(fileSize), chunkSize_(chunkSize) {
  if (chunkSize_ == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }
  const std::uint64_t full = fileSize_ / chunkSize_;
  const bool tail = fileSize_ % chunkSize_ != 0;
  count_ = static_cast<std::size_t>(full + (tail ? 1 : 0));
  if (count_ == 0) {
    count_ = 1;
  }
}

ChunkRange ChunkSlicer::range(std::size_t index) const {
  if (index >= count_) {
    throw std::out_of_range("chunk index " + std::to_string(index) +
                            " out of range (" + std::to_string(count_) + ")");
  }
  ChunkRange r;
  r.index = index;
  r.offset = static_cast<std::uint64_t>(index) * chunkSize_;
  const std::uint64_t remaining = fileSize_ - r.offset;
  r.length = static_cast<std::size_t>(
      remaining < chunkSize_ ? remaining : static_cast<std::uint64_t>(chunkSize_));
  return r;
}

ChunkSlicer splitIntoChunks(std::uint64_t fileSize, std::size_t chunkSize) {
  return ChunkSlicer(fileSize, chunkSize);
}

Bytes encryptChunk(std::span<const std::byte> plain, const Key &contentKey) {
  return seal(contentKey, plain);
}

Bytes decryptChunk(std::span<const std::byte> sealed, const Key &contentKey) {
  auto plain = open(contentKey, sealed);
  if (!plain) {
    throw RelayError(ErrorCode::ChunkAuthError,
                     "Chunk failed authentication (" +
                         std::to_string(sealed.size()) + " bytes)");
  }
  return std::move(*plain);
}

std::string digestHex(std::span<const std::byte> data) {
  ensureSodium();
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(),
                     reinterpret_cast<const unsigned char *>(data.data()),
                     data.size());
  return cppcodec::hex_lower::encode(digest.data(), digest.size());
}

ContentHasher::ContentHasher() {
  ensureSodium();
  crypto_hash_sha256_init(&state_);
}

void ContentHasher::update(std::span<const std::byte> data) {
  if (finalized_) {
    throw std::logic_error("ContentHasher already finalized");
  }
  crypto_hash_sha256_update(
      &state_, reinterpret_cast<const unsigned char *>(data.data()),
      data.size());
}

std::string ContentHasher::finalizeHex() {
  if (finalized_) {
    throw std::logic_error("ContentHasher already finalized");
  }
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256_final(&state_, digest.data());
  finalized_ = true;
  return cppcodec::hex_lower::encode(digest.data(), digest.size());
}

} // namespace quickshare::crypto
