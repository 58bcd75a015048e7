#include "crypto/aead.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <openssl/evp.h>
#include <sodium.h>
#include <stdexcept>

namespace quickshare::crypto {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx newContext() {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  }
  return ctx;
}

const unsigned char *asUChar(const std::byte *p) {
  return reinterpret_cast<const unsigned char *>(p);
}

unsigned char *asUChar(std::byte *p) {
  return reinterpret_cast<unsigned char *>(p);
}

} // namespace

void ensureSodium() {
  static std::once_flag once;
  static bool ok = false;
  std::call_once(once, [] { ok = sodium_init() >= 0; });
  if (!ok) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

void randomBytes(unsigned char *out, std::size_t len) {
  ensureSodium();
  randombytes_buf(out, len);
}

Bytes seal(const Key &key, std::span<const std::byte> plaintext) {
  Bytes out(NONCE_BYTES + plaintext.size() + TAG_BYTES);
  unsigned char *nonce = asUChar(out.data());
  randomBytes(nonce, NONCE_BYTES);

  CipherCtx ctx = newContext();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(NONCE_BYTES), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) !=
          1) {
    throw std::runtime_error("AES-256-GCM encryption setup failed");
  }

  int len = 0;
  unsigned char *cipher = nonce + NONCE_BYTES;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), cipher, &len, asUChar(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    throw std::runtime_error("AES-256-GCM encryption failed");
  }
  int finalLen = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), cipher + len, &finalLen) != 1) {
    throw std::runtime_error("AES-256-GCM finalization failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(TAG_BYTES),
                          cipher + plaintext.size()) != 1) {
    throw std::runtime_error("AES-256-GCM tag extraction failed");
  }
  return out;
}

std::optional<Bytes> open(const Key &key, std::span<const std::byte> sealed) {
  if (sealed.size() < SEAL_OVERHEAD) {
    return std::nullopt;
  }
  const unsigned char *nonce = asUChar(sealed.data());
  const unsigned char *cipher = nonce + NONCE_BYTES;
  const std::size_t cipherLen = sealed.size() - SEAL_OVERHEAD;
  // EVP_CTRL_GCM_SET_TAG takes a non-const pointer.
  unsigned char tag[TAG_BYTES];
  std::copy(cipher + cipherLen, cipher + cipherLen + TAG_BYTES, tag);

  CipherCtx ctx = newContext();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(NONCE_BYTES), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) !=
          1) {
    throw std::runtime_error("AES-256-GCM decryption setup failed");
  }

  Bytes plain(cipherLen);
  int len = 0;
  if (cipherLen > 0 &&
      EVP_DecryptUpdate(ctx.get(), asUChar(plain.data()), &len, cipher,
                        static_cast<int>(cipherLen)) != 1) {
    sodium_memzero(plain.data(), plain.size());
    return std::nullopt;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(TAG_BYTES), tag) != 1) {
    throw std::runtime_error("AES-256-GCM tag setup failed");
  }
  int finalLen = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), asUChar(plain.data()) + len,
                          &finalLen) != 1) {
    // Authentication failed: never hand back the unverified bytes.
    sodium_memzero(plain.data(), plain.size());
    return std::nullopt;
  }
  return plain;
}

void wipe(Key &key) { sodium_memzero(key.data(), key.size()); }

} // namespace quickshare::crypto
