#include "transfer/http_relay_transport.hpp"

#include "relay/wire_format.hpp"
#include "utilities/logger.h"
#include "utilities/relay_error.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace quickshare::transfer {

using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace {

std::string codePath(const std::string &lookupCode, const std::string &action) {
  return "/codes/" + HTTP::UrlEncode(lookupCode) + "/" + action;
}

RelayError errorFrom(const HTTP::HTTPRESPONSE &res) {
  try {
    json body = json::parse(res.body);
    if (body.contains("error") && body.at("error").is_string()) {
      return RelayError(errorCodeFromName(body.at("error").get<std::string>()),
                        body.value("message", res.reasonPhrase));
    }
  } catch (const json::exception &) {
    // Not a relay error body; fall through to the status line.
  }
  return RelayError(ErrorCode::TransportError,
                    "Relay replied " + std::to_string(res.statusCodeNumber) + " " +
                        res.reasonPhrase);
}

} // namespace

HttpRelayTransport::HttpRelayTransport(std::string host, unsigned short port,
                                       std::string bearer)
    : host_(std::move(host)), port_(port), bearer_(std::move(bearer)) {}

HttpRelayTransport HttpRelayTransport::fromAddress(const std::string &address,
                                                   const std::string &bearer) {
  std::string host = address;
  unsigned short port = 8000;
  auto colon = address.rfind(':');
  if (colon != std::string::npos) {
    host = address.substr(0, colon);
    try {
      int parsed = std::stoi(address.substr(colon + 1));
      if (parsed <= 0 || parsed > 65535)
        throw std::out_of_range("port");
      port = static_cast<unsigned short>(parsed);
    } catch (const std::logic_error &) {
      throw RelayError(ErrorCode::InvalidRequest, "Bad relay address " + address);
    }
  }
  if (host.empty())
    host = "127.0.0.1";
  return HttpRelayTransport(host, port, bearer);
}

HTTP::HTTPRESPONSE HttpRelayTransport::send(HTTP::HttpMethod method,
                                            const std::string &uri,
                                            const std::string &body,
                                            const std::string &contentType) {
  HTTP::HTTPREQUEST req;
  req.method = method;
  req.uri = uri;
  req.protocol = "HTTP/1.1";
  req.headers["Host"] = host_ + ":" + std::to_string(port_);
  req.headers["Connection"] = "close";
  if (!body.empty() || method == HTTP::HttpMethod::POST)
    req.headers["Content-Type"] = contentType;
  if (!bearer_.empty())
    req.headers["Authorization"] = "Bearer " + bearer_;
  req.body = body;

  try {
    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    tcp::socket socket(ioc);
    boost::asio::connect(socket, resolver.resolve(host_, std::to_string(port_)));
    boost::asio::write(socket, boost::asio::buffer(HTTP::GenerateHttpRequestString(req)));

    std::string raw;
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::dynamic_buffer(raw), ec);
    if (ec && ec != boost::asio::error::eof) {
      throw boost::system::system_error(ec);
    }
    HTTP::HTTPRESPONSE res = HTTP::ParseHttpResponse(raw);
    if (res.statusCodeNumber == 0) {
      throw RelayError(ErrorCode::TransportError, "Malformed reply from relay");
    }
    return res;
  } catch (const boost::system::system_error &e) {
    throw RelayError(ErrorCode::TransportError,
                     "Relay " + host_ + ":" + std::to_string(port_) +
                         " unreachable: " + e.what());
  }
}

std::string HttpRelayTransport::call(HTTP::HttpMethod method, const std::string &uri,
                                     const std::string &body,
                                     const std::string &contentType) {
  HTTP::HTTPRESPONSE res = send(method, uri, body, contentType);
  if (res.statusCodeNumber < 200 || res.statusCodeNumber >= 300) {
    throw errorFrom(res);
  }
  return res.body;
}

relay::CreateCodeResult
HttpRelayTransport::createCode(const relay::CreateCodeRequest &request) {
  HTTP::HTTPRESPONSE res =
      send(HTTP::HttpMethod::POST, "/codes", json(request).dump(), "application/json");
  if (res.statusCodeNumber == 409) {
    // A duplicate is a decision for the caller, not a failure.
    return relay::parseBody<relay::CreateCodeResult>(res.body);
  }
  if (res.statusCodeNumber < 200 || res.statusCodeNumber >= 300) {
    throw errorFrom(res);
  }
  return relay::parseBody<relay::CreateCodeResult>(res.body);
}

void HttpRelayTransport::storeEncryptedKey(const std::string &lookupCode,
                                           const std::vector<std::byte> &wrappedKey) {
  json body{{"encryptedKey", relay::encodeBase64(wrappedKey)}};
  call(HTTP::HttpMethod::POST, codePath(lookupCode, "store-encrypted-key"), body.dump());
}

std::string HttpRelayTransport::uploadChunk(const std::string &lookupCode,
                                            std::size_t index,
                                            const std::vector<std::byte> &data) {
  std::string raw(reinterpret_cast<const char *>(data.data()), data.size());
  std::string reply =
      call(HTTP::HttpMethod::POST,
           codePath(lookupCode, "upload-chunk") + "?index=" + std::to_string(index),
           raw, "application/octet-stream");
  try {
    return json::parse(reply).at("digest").get<std::string>();
  } catch (const json::exception &e) {
    throw RelayError(ErrorCode::TransportError,
                     std::string("Bad upload-chunk reply: ") + e.what());
  }
}

void HttpRelayTransport::uploadComplete(const std::string &lookupCode,
                                        const relay::UploadManifest &manifest) {
  call(HTTP::HttpMethod::POST, codePath(lookupCode, "upload-complete"),
       json(manifest).dump());
}

relay::KeyFetch HttpRelayTransport::fetchEncryptedKey(const std::string &lookupCode) {
  std::string reply = call(HTTP::HttpMethod::GET, codePath(lookupCode, "encrypted-key"));
  try {
    json body = json::parse(reply);
    relay::KeyFetch fetch;
    fetch.wrappedKey = relay::decodeBase64(body.at("encryptedKey").get<std::string>());
    fetch.sessionId = body.value("sessionId", std::string());
    return fetch;
  } catch (const json::exception &e) {
    throw RelayError(ErrorCode::TransportError,
                     std::string("Bad encrypted-key reply: ") + e.what());
  }
}

relay::FileInfo HttpRelayTransport::fetchFileInfo(const std::string &lookupCode) {
  return relay::parseBody<relay::FileInfo>(
      call(HTTP::HttpMethod::GET, codePath(lookupCode, "file-info")));
}

relay::ChunkBatch
HttpRelayTransport::downloadChunks(const std::string &lookupCode,
                                   const std::vector<std::size_t> &indices,
                                   const std::string &sessionId) {
  json body{{"indices", indices}};
  if (!sessionId.empty())
    body["sessionId"] = sessionId;
  return relay::parseBody<relay::ChunkBatch>(
      call(HTTP::HttpMethod::POST, codePath(lookupCode, "download-chunks"), body.dump()));
}

relay::DownloadCompletion
HttpRelayTransport::downloadComplete(const std::string &lookupCode,
                                     const std::string &sessionId) {
  json body = json::object();
  if (!sessionId.empty())
    body["sessionId"] = sessionId;
  return relay::parseBody<relay::DownloadCompletion>(
      call(HTTP::HttpMethod::POST, codePath(lookupCode, "download-complete"), body.dump()));
}

std::vector<std::string> HttpRelayTransport::invalidateFile(const std::string &fileId) {
  std::string reply = call(HTTP::HttpMethod::POST,
                           "/codes/files/" + HTTP::UrlEncode(fileId) + "/invalidate", "{}");
  try {
    return json::parse(reply).at("invalidatedCodes").get<std::vector<std::string>>();
  } catch (const json::exception &e) {
    throw RelayError(ErrorCode::TransportError,
                     std::string("Bad invalidate reply: ") + e.what());
  }
}

relay::CodeStatusView HttpRelayTransport::status(const std::string &lookupCode) {
  return relay::parseBody<relay::CodeStatusView>(
      call(HTTP::HttpMethod::GET, codePath(lookupCode, "status")));
}

} // namespace quickshare::transfer
