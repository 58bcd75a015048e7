#ifndef QUICKSHARE_LOCAL_RELAY_TRANSPORT_HPP
#define QUICKSHARE_LOCAL_RELAY_TRANSPORT_HPP

#include "relay/cleanup_scheduler.h"
#include "relay/relay_service.hpp"
#include "transfer/relay_transport.hpp"

#include <string>

namespace quickshare::transfer {

/// Calls a RelayService in the same process, acting as @p ownerId.
class LocalRelayTransport : public RelayTransport {
public:
  LocalRelayTransport(relay::RelayService &service, std::string ownerId,
                      relay::CleanupScheduler *cleanup = nullptr);

  relay::CreateCodeResult createCode(const relay::CreateCodeRequest &request) override;
  void storeEncryptedKey(const std::string &lookupCode,
                         const std::vector<std::byte> &wrappedKey) override;
  std::string uploadChunk(const std::string &lookupCode, std::size_t index,
                          const std::vector<std::byte> &data) override;
  void uploadComplete(const std::string &lookupCode,
                      const relay::UploadManifest &manifest) override;
  relay::KeyFetch fetchEncryptedKey(const std::string &lookupCode) override;
  relay::FileInfo fetchFileInfo(const std::string &lookupCode) override;
  relay::ChunkBatch downloadChunks(const std::string &lookupCode,
                                   const std::vector<std::size_t> &indices,
                                   const std::string &sessionId) override;
  relay::DownloadCompletion downloadComplete(const std::string &lookupCode,
                                             const std::string &sessionId) override;
  std::vector<std::string> invalidateFile(const std::string &fileId) override;
  relay::CodeStatusView status(const std::string &lookupCode) override;

  const std::string &ownerId() const { return ownerId_; }

private:
  relay::RelayService &service_;
  std::string ownerId_;
  relay::CleanupScheduler *cleanup_;
};

} // namespace quickshare::transfer

#endif // QUICKSHARE_LOCAL_RELAY_TRANSPORT_HPP
