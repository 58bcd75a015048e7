#include "crypto/key_envelope.hpp"

#include "utilities/pickup_code.hpp"
#include "utilities/relay_error.hpp"

#include <cstring>
#include <openssl/evp.h>
#include <sodium.h>
#include <stdexcept>

namespace quickshare::crypto {

Key generateContentKey() {
  Key key{};
  randomBytes(key.data(), key.size());
  return key;
}

Key deriveWrappingKey(const std::string &keySegment) {
  const std::string segment = PickupCode::normalizeSegment(keySegment);
  const std::string salt = std::string(WRAP_KDF_SALT_PREFIX) + segment;

  Key key{};
  if (PKCS5_PBKDF2_HMAC(segment.data(), static_cast<int>(segment.size()),
                        reinterpret_cast<const unsigned char *>(salt.data()),
                        static_cast<int>(salt.size()), WRAP_KDF_ITERATIONS,
                        EVP_sha256(), static_cast<int>(key.size()),
                        key.data()) != 1) {
    throw std::runtime_error("PBKDF2 derivation failed");
  }
  return key;
}

Bytes wrapKey(const Key &contentKey, const Key &wrappingKey) {
  std::span<const std::byte> raw(
      reinterpret_cast<const std::byte *>(contentKey.data()),
      contentKey.size());
  return seal(wrappingKey, raw);
}

Key unwrapKey(std::span<const std::byte> wrapped, const Key &wrappingKey) {
  if (wrapped.size() != WRAPPED_KEY_BYTES) {
    throw RelayError(ErrorCode::KeyUnwrapError,
                     "Wrapped key has invalid length " +
                         std::to_string(wrapped.size()));
  }
  auto plain = open(wrappingKey, wrapped);
  if (!plain) {
    throw RelayError(ErrorCode::KeyUnwrapError,
                     "Wrapped key failed authentication; the pickup code is "
                     "wrong or the stored key is corrupted");
  }
  Key key{};
  std::memcpy(key.data(), plain->data(), key.size());
  sodium_memzero(plain->data(), plain->size());
  return key;
}

} // namespace quickshare::crypto
