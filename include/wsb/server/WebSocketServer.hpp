#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/error.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace wsb {
class ConnectionManager;
}

namespace wsb::server {

class ClientSession;

/// Accepts TLS WebSocket clients and hands each one to a ClientSession.
class WebSocketServer {
public:
  using tcp = boost::asio::ip::tcp;

  // Opens, binds and listens; throws boost::system::system_error on failure.
  WebSocketServer(boost::asio::io_context& ioc,
                  std::shared_ptr<boost::asio::ssl::context> tls,
                  unsigned short port,
                  ConnectionManager* manager);

  void run();

  // Stop accepting new connections (idempotent).
  void stopAccept() noexcept;

  // Close every live session (idempotent).
  void closeAll() noexcept;

  void registerSession(std::uint64_t id, const std::shared_ptr<ClientSession>& s);
  void unregisterSession(std::uint64_t id) noexcept;
  std::size_t sessionCount() const;

  unsigned short port() const;

private:
  void doAccept();
  void onAccept(boost::beast::error_code ec, tcp::socket socket);

  boost::asio::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<boost::asio::ssl::context> tls_;
  ConnectionManager* manager_{nullptr};

  std::atomic<bool> accepting_{false};

  mutable std::mutex sessions_mu_;
  std::unordered_map<std::uint64_t, std::weak_ptr<ClientSession>> sessions_;
};

} // namespace wsb::server
