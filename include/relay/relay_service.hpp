#ifndef QUICKSHARE_RELAY_SERVICE_HPP
#define QUICKSHARE_RELAY_SERVICE_HPP

#include "relay/code_registry.hpp"
#include "relay/relay_store.hpp"
#include "relay/relay_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace quickshare::relay {

/**
 * @brief Relay-side operations behind the HTTP routes.
 *
 * Holds no state of its own: lifecycle decisions are made by the registry and
 * the bytes live in the store. Every method either succeeds or throws a
 * RelayError whose code maps onto the HTTP status returned to the client.
 * The relay never sees a key segment or a plaintext content key.
 */
class RelayService {
public:
  struct Limits {
    std::size_t maxChunkBytes = 1024 * 1024 + 28;
    std::size_t maxBatchSize = 100;
  };

  RelayService(PickupCodeRegistry &registry, RelayStore &store, Limits limits);

  CreateCodeResult createCode(const CreateCodeRequest &request);

  /// Store the wrapped content key for a code owned by @p ownerId.
  void storeEncryptedKey(const std::string &lookupCode,
                         const std::string &ownerId,
                         std::vector<std::byte> wrappedKey);

  /**
   * @brief Store one encrypted chunk.
   * @return Hex SHA-256 of the bytes as stored, for the sender to confirm.
   */
  std::string uploadChunk(const std::string &lookupCode,
                          const std::string &ownerId, std::size_t index,
                          std::vector<std::byte> data);

  /**
   * @brief Confirm the upload; every chunk index must be present.
   * @throw RelayError(UploadFailed) listing the gaps otherwise.
   */
  void uploadComplete(const std::string &lookupCode, const std::string &ownerId,
                      const UploadManifest &manifest);

  /// @throw RelayError(KeyNotReady) until the sender has finished.
  KeyFetch fetchEncryptedKey(const std::string &lookupCode);

  FileInfo fetchFileInfo(const std::string &lookupCode);

  ChunkBatch downloadChunks(const std::string &lookupCode,
                            const std::vector<std::size_t> &indices,
                            const std::string &sessionId);

  DownloadCompletion downloadComplete(const std::string &lookupCode,
                                      const std::string &sessionId);

  std::vector<std::string> invalidateFile(const std::string &fileId,
                                          const std::string &ownerId);

  CodeStatusView status(const std::string &lookupCode);

  const Limits &limits() const { return limits_; }

private:
  PickupCodeRegistry &registry_;
  RelayStore &store_;
  Limits limits_;
};

} // namespace quickshare::relay

#endif // QUICKSHARE_RELAY_SERVICE_HPP
