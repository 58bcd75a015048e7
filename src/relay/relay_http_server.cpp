#include "relay/relay_http_server.hpp"

#include "relay/wire_format.hpp"
#include "utilities/logger.h"
#include "utilities/pickup_code.hpp"
#include "utilities/relay_error.hpp"

#include <chrono>
#include <cppcodec/base64_url_unpadded.hpp>
#include <ctime>
#include <nlohmann/json.hpp>
#include <sodium.h>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace quickshare::relay {

using tcp = boost::asio::ip::tcp;
using base64url = cppcodec::base64_url_unpadded;
using json = nlohmann::json;

namespace {

const char *const kComponent = "http";

std::vector<std::string> splitPath(const std::string &path) {
  std::vector<std::string> parts;
  std::istringstream in(path);
  std::string part;
  while (std::getline(in, part, '/')) {
    if (!part.empty())
      parts.push_back(part);
  }
  return parts;
}

HTTP::HTTPRESPONSE jsonResponse(int status, const json &body) {
  return HTTP::MakeResponse(status, "application/json", body.dump());
}

HTTP::HTTPRESPONSE errorResponse(ErrorCode code, const std::string &message) {
  return jsonResponse(httpStatusFor(code),
                      json{{"error", errorCodeName(code)}, {"message", message}});
}

std::vector<std::byte> toBytes(const std::string &s) {
  std::vector<std::byte> out(s.size());
  for (std::size_t i = 0; i < s.size(); ++i)
    out[i] = static_cast<std::byte>(s[i]);
  return out;
}

json parseJson(const std::string &body) {
  if (body.empty())
    return json::object();
  try {
    return json::parse(body);
  } catch (const json::exception &e) {
    throw RelayError(ErrorCode::InvalidRequest,
                     std::string("Malformed request body: ") + e.what());
  }
}

std::string sessionFrom(const json &body) {
  if (body.contains("sessionId") && body.at("sessionId").is_string())
    return body.at("sessionId").get<std::string>();
  return "";
}

} // namespace

RelayHttpServer::RelayHttpServer(boost::asio::io_context &ioc,
                                 unsigned short port, RelayService &service,
                                 std::string secret, CleanupScheduler *cleanup,
                                 std::size_t workers)
    : acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), service_(service),
      secret_(std::move(secret)), cleanup_(cleanup),
      workers_(workers == 0 ? 1 : workers),
      port_(acceptor_.local_endpoint().port()),
      maxBodyBytes_(service.limits().maxChunkBytes + 64 * 1024) {}

RelayHttpServer::~RelayHttpServer() { stop(); }

void RelayHttpServer::run() {
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Relay listening on port " + std::to_string(port_));
  do_accept();
}

void RelayHttpServer::stop() {
  boost::system::error_code ec;
  acceptor_.close(ec);
  workers_.join();
}

void RelayHttpServer::do_accept() {
  acceptor_.async_accept(
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        on_accept(ec, std::move(socket));
      });
}

void RelayHttpServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
  if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
    return;
  }
  if (!ec) {
    boost::asio::post(workers_, [this, s = std::move(socket)]() mutable {
      serve(std::move(s));
    });
  } else {
    Logger::getInstance().log(LogLevel::WARN, kComponent,
                              "Accept failed: " + ec.message());
  }
  do_accept();
}

void RelayHttpServer::serve(tcp::socket socket) {
  try {
    std::string header;
    std::size_t headEnd = boost::asio::read_until(
        socket, boost::asio::dynamic_buffer(header, HTTP::MAX_HEADER_BYTES),
        "\r\n\r\n");
    std::string body = header.substr(headEnd);
    header.erase(headEnd);

    HTTP::HTTPRESPONSE res;
    HTTP::HTTPREQUEST req = HTTP::ParseHttpRequest(header);
    std::size_t remaining = 0;
    bool malformed = false;
    try {
      remaining = HTTP::ContentLength(req.headers);
    } catch (const std::invalid_argument &) {
      malformed = true;
    }
    if (malformed) {
      res = errorResponse(ErrorCode::InvalidRequest, "Malformed Content-Length");
    } else if (remaining > maxBodyBytes_) {
      res = jsonResponse(413, json{{"error", errorCodeName(ErrorCode::InvalidRequest)},
                                   {"message", "Request body too large"}});
    } else {
      if (body.size() < remaining) {
        std::string rest(remaining - body.size(), '\0');
        boost::asio::read(socket, boost::asio::buffer(rest));
        body += rest;
      }
      body.resize(remaining);
      req.body = std::move(body);
      res = handle(req);
    }
    boost::asio::write(socket, boost::asio::buffer(HTTP::GenerateResponseString(res)));
    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_send, ignored);
  } catch (const boost::system::system_error &e) {
    Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                              std::string("Connection dropped: ") + e.what());
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, kComponent,
                              std::string("Request handling failed: ") + e.what());
  }
}

bool RelayHttpServer::verify_jwt(const std::string &jwt, std::string &subject) const {
  auto firstDot = jwt.find('.');
  if (firstDot == std::string::npos)
    return false;
  auto secondDot = jwt.find('.', firstDot + 1);
  if (secondDot == std::string::npos)
    return false;
  std::string header = jwt.substr(0, firstDot);
  std::string payload = jwt.substr(firstDot + 1, secondDot - firstDot - 1);
  std::string sig = jwt.substr(secondDot + 1);

  std::string signing_input = header + "." + payload;
  std::vector<unsigned char> mac(crypto_auth_hmacsha256_BYTES);
  crypto_auth_hmacsha256_state state;
  crypto_auth_hmacsha256_init(
      &state, reinterpret_cast<const unsigned char *>(secret_.data()),
      secret_.size());
  crypto_auth_hmacsha256_update(
      &state, reinterpret_cast<const unsigned char *>(signing_input.data()),
      signing_input.size());
  crypto_auth_hmacsha256_final(&state, mac.data());

  try {
    std::string decoded = base64url::decode<std::string>(sig);
    if (decoded.size() != mac.size())
      return false;
    if (sodium_memcmp(mac.data(), decoded.data(), mac.size()) != 0)
      return false;

    json claims = json::parse(base64url::decode<std::string>(payload));
    if (!claims.contains("sub") || !claims.at("sub").is_string())
      return false;
    if (claims.contains("exp") && claims.at("exp").is_number() &&
        claims.at("exp").get<std::int64_t>() <= static_cast<std::int64_t>(std::time(nullptr)))
      return false;
    subject = claims.at("sub").get<std::string>();
    return !subject.empty();
  } catch (const cppcodec::parse_error &) {
    return false;
  } catch (const json::exception &) {
    return false;
  }
}

std::optional<std::string>
RelayHttpServer::authenticate(const HTTP::HTTPREQUEST &req) const {
  std::string auth = HTTP::FindHeader(req.headers, "Authorization");
  if (auth.empty())
    return std::string(ANONYMOUS_OWNER);
  const std::string prefix = "Bearer ";
  if (secret_.empty() || auth.substr(0, prefix.size()) != prefix)
    return std::nullopt;
  std::string subject;
  if (!verify_jwt(auth.substr(prefix.size()), subject))
    return std::nullopt;
  return subject;
}

HTTP::HTTPRESPONSE RelayHttpServer::handle(const HTTP::HTTPREQUEST &req) {
  auto owner = authenticate(req);
  if (!owner) {
    return errorResponse(ErrorCode::Unauthorized, "Invalid bearer token");
  }
  try {
    return route(req, *owner);
  } catch (const RelayError &e) {
    const int status = httpStatusFor(e.code());
    Logger::getInstance().log(status >= 500 ? LogLevel::ERROR : LogLevel::DEBUG,
                              kComponent,
                              HTTP::HttpMethodToString(req.method) + " " + req.path +
                                  " -> " + std::to_string(status) + " " +
                                  e.reason() + ": " + e.what());
    return errorResponse(e.code(), e.what());
  } catch (const json::exception &e) {
    return errorResponse(ErrorCode::InvalidRequest,
                         std::string("Malformed request body: ") + e.what());
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, kComponent,
                              HTTP::HttpMethodToString(req.method) + " " + req.path +
                                  " failed: " + e.what());
    return errorResponse(ErrorCode::Internal, "Internal server error");
  }
}

HTTP::HTTPRESPONSE RelayHttpServer::route(const HTTP::HTTPREQUEST &req,
                                          const std::string &owner) {
  const auto parts = splitPath(req.path);
  const bool isGet = req.method == HTTP::HttpMethod::GET;
  const bool isPost = req.method == HTTP::HttpMethod::POST;

  if (isGet && parts.size() == 1 && parts[0] == "health") {
    return jsonResponse(200, json{{"status", "ok"}});
  }
  if (parts.empty() || parts[0] != "codes") {
    return errorResponse(ErrorCode::CodeNotFound, "No route for " + req.path);
  }
  if (isPost && parts.size() == 1) {
    CreateCodeRequest request = parseBody<CreateCodeRequest>(req.body);
    request.ownerId = owner;
    CreateCodeResult result = service_.createCode(request);
    return jsonResponse(result.conflict ? 409 : 201, json(result));
  }
  if (isPost && parts.size() == 4 && parts[1] == "files" && parts[3] == "invalidate") {
    auto codes = service_.invalidateFile(parts[2], owner);
    if (cleanup_) {
      cleanup_->sweepOwner(owner);
    }
    return jsonResponse(200, json{{"invalidatedCodes", codes}});
  }
  if (parts.size() != 3) {
    return errorResponse(ErrorCode::CodeNotFound, "No route for " + req.path);
  }

  const std::string lookup = PickupCode::normalizeSegment(parts[1]);
  const std::string &action = parts[2];

  if (isGet && action == "status") {
    return jsonResponse(200, json(service_.status(lookup)));
  }
  if (isPost && action == "store-encrypted-key") {
    json body = parseJson(req.body);
    if (!body.contains("encryptedKey") || !body.at("encryptedKey").is_string()) {
      throw RelayError(ErrorCode::InvalidRequest, "Missing encryptedKey");
    }
    service_.storeEncryptedKey(lookup, owner,
                               decodeBase64(body.at("encryptedKey").get<std::string>()));
    return jsonResponse(200, json{{"stored", true}});
  }
  if (isPost && action == "upload-chunk") {
    auto it = req.query.find("index");
    std::size_t index = 0;
    try {
      if (it == req.query.end())
        throw std::invalid_argument("missing");
      index = static_cast<std::size_t>(std::stoull(it->second));
    } catch (const std::logic_error &) {
      throw RelayError(ErrorCode::InvalidRequest, "upload-chunk needs ?index=N");
    }
    std::string digest = service_.uploadChunk(lookup, owner, index, toBytes(req.body));
    return jsonResponse(200, json{{"index", index}, {"digest", digest}});
  }
  if (isPost && action == "upload-complete") {
    UploadManifest manifest = parseBody<UploadManifest>(req.body);
    service_.uploadComplete(lookup, owner, manifest);
    return jsonResponse(200, json{{"status", "transferring"}});
  }
  if (isGet && action == "encrypted-key") {
    KeyFetch fetch = service_.fetchEncryptedKey(lookup);
    return jsonResponse(200, json{{"encryptedKey", encodeBase64(fetch.wrappedKey)},
                                  {"sessionId", fetch.sessionId}});
  }
  if (isGet && action == "file-info") {
    return jsonResponse(200, json(service_.fetchFileInfo(lookup)));
  }
  if (isPost && action == "download-chunks") {
    json body = parseJson(req.body);
    if (!body.contains("indices") || !body.at("indices").is_array()) {
      throw RelayError(ErrorCode::InvalidRequest, "Missing indices");
    }
    auto indices = body.at("indices").get<std::vector<std::size_t>>();
    ChunkBatch batch = service_.downloadChunks(lookup, indices, sessionFrom(body));
    return jsonResponse(200, json(batch));
  }
  if (isPost && action == "download-complete") {
    json body = parseJson(req.body);
    return jsonResponse(200, json(service_.downloadComplete(lookup, sessionFrom(body))));
  }
  return errorResponse(ErrorCode::CodeNotFound, "No route for " + req.path);
}

} // namespace quickshare::relay
