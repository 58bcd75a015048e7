#ifndef QUICKSHARE_RELAY_TRANSPORT_HPP
#define QUICKSHARE_RELAY_TRANSPORT_HPP

#include "relay/relay_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace quickshare::transfer {

/**
 * @brief Client's view of the relay.
 *
 * The caller's identity is a property of the transport instance. Every
 * failure surfaces as a RelayError with the same code regardless of whether
 * the relay is in-process or remote. Implementations must tolerate concurrent
 * downloadChunks() calls.
 */
class RelayTransport {
public:
  virtual ~RelayTransport() = default;

  virtual relay::CreateCodeResult createCode(const relay::CreateCodeRequest &request) = 0;
  virtual void storeEncryptedKey(const std::string &lookupCode,
                                 const std::vector<std::byte> &wrappedKey) = 0;
  /// @return Hex SHA-256 of the chunk as stored by the relay.
  virtual std::string uploadChunk(const std::string &lookupCode, std::size_t index,
                                  const std::vector<std::byte> &data) = 0;
  virtual void uploadComplete(const std::string &lookupCode,
                              const relay::UploadManifest &manifest) = 0;
  virtual relay::KeyFetch fetchEncryptedKey(const std::string &lookupCode) = 0;
  virtual relay::FileInfo fetchFileInfo(const std::string &lookupCode) = 0;
  virtual relay::ChunkBatch downloadChunks(const std::string &lookupCode,
                                           const std::vector<std::size_t> &indices,
                                           const std::string &sessionId) = 0;
  virtual relay::DownloadCompletion downloadComplete(const std::string &lookupCode,
                                                     const std::string &sessionId) = 0;
  virtual std::vector<std::string> invalidateFile(const std::string &fileId) = 0;
  virtual relay::CodeStatusView status(const std::string &lookupCode) = 0;
};

} // namespace quickshare::transfer

#endif // QUICKSHARE_RELAY_TRANSPORT_HPP
