#ifndef QUICKSHARE_RELAY_HTTP_SERVER_HPP
#define QUICKSHARE_RELAY_HTTP_SERVER_HPP

#include "relay/cleanup_scheduler.h"
#include "relay/relay_service.hpp"
#include "utilities/http.hpp"

#include <boost/asio.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace quickshare::relay {

/// Owner id used for requests without a bearer token.
inline constexpr const char *ANONYMOUS_OWNER = "anonymous";

/**
 * @brief JSON-over-HTTP front end of the relay.
 *
 * Connections are accepted on the io_context and each request is served on a
 * worker pool, one request per connection. Identity comes from an optional
 * HS256 bearer token whose `sub` claim names the owner.
 */
class RelayHttpServer {
public:
  /**
   * @brief Bind the listening socket.
   * @param ioc     I/O context driving the acceptor.
   * @param port    Port to bind; 0 picks an ephemeral port.
   * @param service Relay operations.
   * @param secret  HMAC secret for JWT verification; empty disables tokens.
   * @param cleanup Optional scheduler swept on demand after invalidation.
   * @param workers Number of request worker threads.
   */
  RelayHttpServer(boost::asio::io_context &ioc, unsigned short port,
                  RelayService &service, std::string secret,
                  CleanupScheduler *cleanup = nullptr, std::size_t workers = 4);
  ~RelayHttpServer();

  RelayHttpServer(const RelayHttpServer &) = delete;
  RelayHttpServer &operator=(const RelayHttpServer &) = delete;

  /** Begin accepting connections. */
  void run();
  /** Stop accepting and wait for in-flight requests. */
  void stop();
  unsigned short port() const { return port_; }

  /** Route one parsed request to the relay and render the reply. */
  HTTP::HTTPRESPONSE handle(const HTTP::HTTPREQUEST &req);

  /**
   * @brief Resolve the caller's owner id.
   * @return ANONYMOUS_OWNER without a token, the `sub` claim of a valid token,
   *         or std::nullopt if a token is present but invalid.
   */
  std::optional<std::string> authenticate(const HTTP::HTTPREQUEST &req) const;

private:
  void do_accept();
  void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
  void serve(boost::asio::ip::tcp::socket socket);
  bool verify_jwt(const std::string &jwt, std::string &subject) const;
  HTTP::HTTPRESPONSE route(const HTTP::HTTPREQUEST &req, const std::string &owner);

  boost::asio::ip::tcp::acceptor acceptor_;
  RelayService &service_;
  std::string secret_;
  CleanupScheduler *cleanup_;
  boost::asio::thread_pool workers_;
  unsigned short port_;
  std::size_t maxBodyBytes_;
};

} // namespace quickshare::relay

#endif // QUICKSHARE_RELAY_HTTP_SERVER_HPP
