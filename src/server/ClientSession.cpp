#include "wsb/server/ClientSession.hpp"
#include "wsb/server/WebSocketServer.hpp"
#include "wsb/ConnectionManager.hpp"
#include "wsb/Version.hpp"
#include "wsb/util/Logger.hpp"
#include "wsb/util/Metrics.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <stdexcept>

namespace wsb::server {

namespace websocket = boost::beast::websocket;
namespace beast     = boost::beast;
namespace http      = boost::beast::http;
namespace ssl       = boost::asio::ssl;

using util::LogLevel;
using util::logger;

// Outbound frames a slow client may have queued before it is dropped.
static constexpr std::size_t kMaxQueued = 1024;

ClientSession::ClientSession(tcp::socket socket,
                             ssl::context& tls,
                             WebSocketServer* server,
                             ConnectionManager* manager)
  : ws_(std::move(socket), tls)
  , server_(server)
  , manager_(manager)
{
  beast::error_code ec;
  auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
  if (!ec) peer_ = ep.address().to_string() + ":" + std::to_string(ep.port());
}

void ClientSession::run() {
  auto self = shared_from_this();

  beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
  ws_.next_layer().async_handshake(
      ssl::stream_base::server,
      [self](beast::error_code ec) { self->onHandshake(ec); });
}

void ClientSession::onHandshake(beast::error_code ec) {
  if (ec) {
    logger().log(LogLevel::Warn, "TLS handshake failed", {{"peer", peer_}, {"error", ec.message()}});
    return;
  }

  // The websocket stream has its own timeouts from here on
  beast::get_lowest_layer(ws_).expires_never();

  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& res) {
        res.set(http::field::server,
                std::string(BOOST_BEAST_VERSION_STRING) + " wsb/" + kVersion);
      }));

  auto self = shared_from_this();
  ws_.async_accept([self](beast::error_code ec2) { self->onAccept(ec2); });
}

void ClientSession::onAccept(beast::error_code ec) {
  if (ec) {
    logger().log(LogLevel::Warn, "websocket accept failed", {{"peer", peer_}, {"error", ec.message()}});
    return;
  }

  ws_.text(true);
  open_ = true;

  std::weak_ptr<ClientSession> weak = shared_from_this();
  if (manager_) {
    sessionId_ = manager_->nextId();
  }
  if (server_) {
    server_->registerSession(sessionId_, shared_from_this());
  }
  if (manager_) {
    manager_->onOpen(sessionId_, [weak](const std::string& text) {
      auto sp = weak.lock();
      if (!sp) throw std::runtime_error("session is gone");
      sp->sendText(text);
    });
  }

  logger().log(LogLevel::Debug, "session open", {{"peer", peer_}, {"conn", std::to_string(sessionId_)}});
  doRead();
}

void ClientSession::sendText(std::string s) {
  if (!open_) throw std::runtime_error("session is closed");

  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, msg = std::move(s)]() mutable {
    if (self->closing_ || !self->open_) return;
    if (self->outbox_.size() >= kMaxQueued) {
      WSB_METRIC_HIT("session.overflow");
      logger().log(LogLevel::Warn, "client too slow, closing",
                   {{"conn", std::to_string(self->sessionId_)}, {"queued", std::to_string(self->outbox_.size())}});
      self->stop();
      return;
    }
    self->outbox_.emplace_back(std::move(msg));
    if (!self->writing_) {
      self->writing_ = true;
      self->doWrite();
    }
  });
}

void ClientSession::stop() noexcept {
  try {
    auto self = shared_from_this();
    boost::asio::post(ws_.get_executor(), [self]() {
      if (self->closing_ || !self->open_) return;
      self->closing_ = true;

      websocket::close_reason cr;
      cr.code   = websocket::close_code::normal;
      cr.reason = "closing";
      self->ws_.async_close(cr, [self](beast::error_code ec) {
        self->finish(ec, "close");
      });
    });
  } catch (const std::exception& e) {
    logger().log(LogLevel::Error, "session stop failed", {{"error", e.what()}});
  }
}

void ClientSession::doRead() {
  auto self = shared_from_this();
  ws_.async_read(
      buffer_,
      [self](beast::error_code ec, std::size_t bytes) { self->onRead(ec, bytes); });
}

void ClientSession::onRead(beast::error_code ec, std::size_t) {
  if (ec) {
    finish(ec, "read");
    return;
  }

  const std::string text = beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());

  if (manager_) {
    manager_->onMessage(sessionId_, text);
  }

  doRead();
}

void ClientSession::doWrite() {
  auto self = shared_from_this();
  ws_.async_write(
      boost::asio::buffer(outbox_.front()),
      [self](beast::error_code ec, std::size_t bytes) { self->onWrite(ec, bytes); });
}

void ClientSession::onWrite(beast::error_code ec, std::size_t) {
  if (ec) {
    writing_ = false;
    finish(ec, "write");
    return;
  }

  outbox_.pop_front();
  if (!outbox_.empty() && !closing_) {
    doWrite();
  } else {
    writing_ = false;
  }
}

void ClientSession::finish(beast::error_code ec, const char* where) {
  if (finished_.exchange(true)) return;
  open_ = false;

  if (ec && ec != websocket::error::closed && ec != boost::asio::error::operation_aborted) {
    logger().log(LogLevel::Warn, "session error",
                 {{"conn", std::to_string(sessionId_)}, {"where", where}, {"error", ec.message()}});
  }

  if (manager_) manager_->onClose(sessionId_);
  if (server_) server_->unregisterSession(sessionId_);
}

} // namespace wsb::server
