#include "transfer/local_relay_transport.hpp"

#include <utility>

namespace quickshare::transfer {

LocalRelayTransport::LocalRelayTransport(relay::RelayService &service,
                                         std::string ownerId,
                                         relay::CleanupScheduler *cleanup)
    : service_(service), ownerId_(std::move(ownerId)), cleanup_(cleanup) {}

relay::CreateCodeResult
LocalRelayTransport::createCode(const relay::CreateCodeRequest &request) {
  relay::CreateCodeRequest owned = request;
  owned.ownerId = ownerId_;
  return service_.createCode(owned);
}

void LocalRelayTransport::storeEncryptedKey(const std::string &lookupCode,
                                            const std::vector<std::byte> &wrappedKey) {
  service_.storeEncryptedKey(lookupCode, ownerId_, wrappedKey);
}

std::string LocalRelayTransport::uploadChunk(const std::string &lookupCode,
                                             std::size_t index,
                                             const std::vector<std::byte> &data) {
  return service_.uploadChunk(lookupCode, ownerId_, index, data);
}

void LocalRelayTransport::uploadComplete(const std::string &lookupCode,
                                         const relay::UploadManifest &manifest) {
  service_.uploadComplete(lookupCode, ownerId_, manifest);
}

relay::KeyFetch LocalRelayTransport::fetchEncryptedKey(const std::string &lookupCode) {
  return service_.fetchEncryptedKey(lookupCode);
}

relay::FileInfo LocalRelayTransport::fetchFileInfo(const std::string &lookupCode) {
  return service_.fetchFileInfo(lookupCode);
}

relay::ChunkBatch
LocalRelayTransport::downloadChunks(const std::string &lookupCode,
                                    const std::vector<std::size_t> &indices,
                                    const std::string &sessionId) {
  return service_.downloadChunks(lookupCode, indices, sessionId);
}

relay::DownloadCompletion
LocalRelayTransport::downloadComplete(const std::string &lookupCode,
                                      const std::string &sessionId) {
  return service_.downloadComplete(lookupCode, sessionId);
}

std::vector<std::string> LocalRelayTransport::invalidateFile(const std::string &fileId) {
  auto codes = service_.invalidateFile(fileId, ownerId_);
  if (cleanup_) {
    cleanup_->sweepOwner(ownerId_);
  }
  return codes;
}

relay::CodeStatusView LocalRelayTransport::status(const std::string &lookupCode) {
  return service_.status(lookupCode);
}

} // namespace quickshare::transfer
