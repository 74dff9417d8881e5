#include "wsb/server/WebSocketServer.hpp"
#include "wsb/server/ClientSession.hpp"
#include "wsb/util/Logger.hpp"

#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>

#include <vector>

namespace wsb::server {

namespace beast = boost::beast;

using util::LogLevel;
using util::logger;

WebSocketServer::WebSocketServer(boost::asio::io_context& ioc,
                                 std::shared_ptr<boost::asio::ssl::context> tls,
                                 unsigned short port,
                                 ConnectionManager* manager)
  : ioc_(ioc)
  , acceptor_(ioc)
  , tls_(std::move(tls))
  , manager_(manager)
{
  beast::error_code ec;
  tcp::endpoint ep{tcp::v4(), port};

  acceptor_.open(ep.protocol(), ec);
  if (ec) throw boost::system::system_error(ec, "open");

  acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) throw boost::system::system_error(ec, "set_option");

  acceptor_.bind(ep, ec);
  if (ec) throw boost::system::system_error(ec, "bind");

  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) throw boost::system::system_error(ec, "listen");
}

void WebSocketServer::run() {
  if (accepting_.exchange(true)) return;
  logger().log(LogLevel::Info, "WebSocket server is running", {{"port", std::to_string(port())}});
  doAccept();
}

unsigned short WebSocketServer::port() const {
  beast::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void WebSocketServer::doAccept() {
  if (!accepting_.load(std::memory_order_relaxed)) return;
  acceptor_.async_accept(
      boost::asio::make_strand(ioc_),
      [this](beast::error_code ec, tcp::socket socket) {
        onAccept(ec, std::move(socket));
      });
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (!accepting_.load(std::memory_order_relaxed)) return;

  if (ec) {
    logger().log(LogLevel::Error, "server error", {{"where", "accept"}, {"error", ec.message()}});
  } else {
    std::make_shared<ClientSession>(std::move(socket), *tls_, this, manager_)->run();
  }

  doAccept();
}

void WebSocketServer::registerSession(std::uint64_t id, const std::shared_ptr<ClientSession>& s) {
  if (!s) return;
  std::lock_guard<std::mutex> lk(sessions_mu_);
  sessions_[id] = s;
}

void WebSocketServer::unregisterSession(std::uint64_t id) noexcept {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  (void)sessions_.erase(id);
}

std::size_t WebSocketServer::sessionCount() const {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  return sessions_.size();
}

void WebSocketServer::stopAccept() noexcept {
  accepting_.store(false, std::memory_order_relaxed);
  beast::error_code ec;
  // Both are no-ops on an already closed acceptor
  acceptor_.cancel(ec);
  acceptor_.close(ec);
}

void WebSocketServer::closeAll() noexcept {
  // Snapshot to call stop() without holding the mutex; each session
  // unregisters itself when its close completes.
  std::vector<std::shared_ptr<ClientSession>> to_close;
  {
    std::lock_guard<std::mutex> lk(sessions_mu_);
    to_close.reserve(sessions_.size());
    for (auto& kv : sessions_) {
      if (auto sp = kv.second.lock()) {
        to_close.emplace_back(std::move(sp));
      }
    }
  }
  for (auto& s : to_close) {
    s->stop();
  }
}

} // namespace wsb::server
