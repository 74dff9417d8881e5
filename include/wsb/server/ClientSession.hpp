#pragma once
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

namespace wsb {
class ConnectionManager;
}

namespace wsb::server {

class WebSocketServer;

/// One TLS WebSocket client. Reads feed ConnectionManager::onMessage;
/// writes are queued and drained one at a time on the session strand.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
  using tcp = boost::asio::ip::tcp;
  using Ws  = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

  ClientSession(tcp::socket socket,
                boost::asio::ssl::context& tls,
                WebSocketServer* server,
                ConnectionManager* manager);

  // TLS handshake, WebSocket accept, then snapshot push and read loop.
  void run();

  // Queue a text frame. Thread-safe. Throws std::runtime_error once the
  // session is closed.
  void sendText(std::string s);

  // Gracefully close the WebSocket (idempotent).
  void stop() noexcept;

  std::uint64_t id() const { return sessionId_; }
  bool isOpen() const { return open_.load(); }

private:
  void onHandshake(boost::beast::error_code ec);
  void onAccept(boost::beast::error_code ec);

  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytes);

  void doWrite();
  void onWrite(boost::beast::error_code ec, std::size_t bytes);

  // Runs once: unbinds from the manager and the server.
  void finish(boost::beast::error_code ec, const char* where);

private:
  Ws ws_;
  WebSocketServer*   server_{nullptr};
  ConnectionManager* manager_{nullptr};
  boost::beast::flat_buffer buffer_;

  std::atomic<bool> open_{false};
  std::atomic<bool> finished_{false};
  std::uint64_t sessionId_{0};
  std::string peer_;

  // strand-only
  std::deque<std::string> outbox_;
  bool writing_{false};
  bool closing_{false};
};

} // namespace wsb::server
