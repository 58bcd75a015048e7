#ifndef QUICKSHARE_AEAD_HPP
#define QUICKSHARE_AEAD_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace quickshare::crypto {

inline constexpr std::size_t KEY_BYTES = 32;   ///< AES-256
inline constexpr std::size_t NONCE_BYTES = 12; ///< GCM IV
inline constexpr std::size_t TAG_BYTES = 16;   ///< GCM tag
/// Size added to a plaintext by seal(): nonce prefix plus tag suffix.
inline constexpr std::size_t SEAL_OVERHEAD = NONCE_BYTES + TAG_BYTES;

using Key = std::array<unsigned char, KEY_BYTES>;
using Bytes = std::vector<std::byte>;

/**
 * @brief Initialize libsodium exactly once.
 * @throw std::runtime_error if the library cannot be initialized.
 */
void ensureSodium();

/** Fill @p out with bytes from the system CSPRNG. */
void randomBytes(unsigned char *out, std::size_t len);

/**
 * @brief AES-256-GCM encrypt under a fresh random 12-byte nonce.
 * @return nonce || ciphertext || tag
 * @throw std::runtime_error if the cipher backend fails.
 */
Bytes seal(const Key &key, std::span<const std::byte> plaintext);

/**
 * @brief Inverse of seal().
 * @return The plaintext, or std::nullopt if the input is too short or fails
 *         authentication (wrong key, truncation, tampering).
 */
std::optional<Bytes> open(const Key &key, std::span<const std::byte> sealed);

/** Overwrite key material in place. */
void wipe(Key &key);

} // namespace quickshare::crypto

#endif // QUICKSHARE_AEAD_HPP
