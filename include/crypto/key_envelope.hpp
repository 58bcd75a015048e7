#ifndef QUICKSHARE_KEY_ENVELOPE_HPP
#define QUICKSHARE_KEY_ENVELOPE_HPP

#include "crypto/aead.hpp"

#include <span>
#include <string>

namespace quickshare::crypto {

/// PBKDF2-HMAC-SHA256 work factor for wrapping-key derivation.
inline constexpr int WRAP_KDF_ITERATIONS = 100000;
/// Salt is this prefix followed by the key segment.
inline constexpr const char *WRAP_KDF_SALT_PREFIX = "quick-share-salt-";
/// Size of a wrapped content key: nonce || encrypted key || tag.
inline constexpr std::size_t WRAPPED_KEY_BYTES = KEY_BYTES + SEAL_OVERHEAD;

/**
 * @brief Generate the random per-file content key.
 * @throw std::runtime_error if the entropy source is unavailable.
 */
Key generateContentKey();

/**
 * @brief Derive the wrapping key from the 6 character key segment.
 *
 * Deterministic: sender and receiver each derive the same key from the code
 * without ever exchanging it.
 *
 * @throw RelayError(InvalidRequest) if @p keySegment is malformed.
 */
Key deriveWrappingKey(const std::string &keySegment);

/** Encrypt @p contentKey under @p wrappingKey for untrusted storage. */
Bytes wrapKey(const Key &contentKey, const Key &wrappingKey);

/**
 * @brief Recover the content key.
 *
 * This is the only point where a wrong pickup code is detected.
 *
 * @throw RelayError(KeyUnwrapError) on authentication failure or a malformed
 *        envelope.
 */
Key unwrapKey(std::span<const std::byte> wrapped, const Key &wrappingKey);

} // namespace quickshare::crypto

#endif // QUICKSHARE_KEY_ENVELOPE_HPP
