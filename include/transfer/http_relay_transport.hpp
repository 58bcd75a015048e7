#ifndef QUICKSHARE_HTTP_RELAY_TRANSPORT_HPP
#define QUICKSHARE_HTTP_RELAY_TRANSPORT_HPP

#include "transfer/relay_transport.hpp"
#include "utilities/http.hpp"

#include <string>

namespace quickshare::transfer {

/**
 * @brief RelayTransport over the relay's JSON HTTP API.
 *
 * Each call uses its own connection, so concurrent calls are independent.
 * Socket failures become RelayError(TransportError); error replies from the
 * relay are mapped back onto their ErrorCode by reason string.
 */
class HttpRelayTransport : public RelayTransport {
public:
  /**
   * @param host   Relay host name or address.
   * @param port   Relay port.
   * @param bearer Optional JWT sent as `Authorization: Bearer`.
   */
  HttpRelayTransport(std::string host, unsigned short port, std::string bearer = "");

  /// Parse "host:port" (port defaults to 8000).
  static HttpRelayTransport fromAddress(const std::string &address,
                                        const std::string &bearer = "");

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

private:
  HTTP::HTTPRESPONSE send(HTTP::HttpMethod method, const std::string &uri,
                          const std::string &body, const std::string &contentType);
  /// send() and throw the relay's error for any non-2xx status.
  std::string call(HTTP::HttpMethod method, const std::string &uri,
                   const std::string &body = "",
                   const std::string &contentType = "application/json");

  std::string host_;
  unsigned short port_;
  std::string bearer_;
};

} // namespace quickshare::transfer

#endif // QUICKSHARE_HTTP_RELAY_TRANSPORT_HPP
