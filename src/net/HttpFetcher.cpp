#include "wsb/net/HttpFetcher.hpp"
#include "wsb/Version.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <optional>
#include <stdexcept>

namespace wsb::net {

namespace beast = boost::beast;
namespace http  = boost::beast::http;
namespace ssl   = boost::asio::ssl;
using tcp       = boost::asio::ip::tcp;

Url Url::parse(const std::string& url) {
  Url u;
  std::string rest;

  auto sep = url.find("://");
  if (sep == std::string::npos) {
    throw std::invalid_argument("unsupported URL '" + url + "': missing scheme");
  }
  std::string scheme = url.substr(0, sep);
  for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (scheme == "https") {
    u.tls = true;
  } else if (scheme != "http") {
    throw std::invalid_argument("unsupported URL scheme '" + scheme + "'");
  }
  rest = url.substr(sep + 3);

  auto slash = rest.find_first_of("/?");
  std::string authority = rest.substr(0, slash);
  u.target = slash == std::string::npos ? "/" : rest.substr(slash);
  if (!u.target.empty() && u.target[0] == '?') u.target = "/" + u.target;

  auto at = authority.rfind('@');
  if (at != std::string::npos) authority = authority.substr(at + 1);

  auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    u.host = authority.substr(0, colon);
    u.port = authority.substr(colon + 1);
  } else {
    u.host = authority;
  }
  if (u.host.empty()) {
    throw std::invalid_argument("unsupported URL '" + url + "': empty host");
  }
  if (u.port.empty()) {
    u.port = u.tls ? "443" : "80";
  }
  for (char c : u.port) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("unsupported URL '" + url + "': bad port");
    }
  }
  return u;
}

namespace {

// One request/response exchange. Lives on a private io_context; the
// lowest-layer expiry bounds every step.
template <class Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
public:
  Exchange(Stream& stream, const Url& url, std::chrono::milliseconds timeout)
    : stream_(stream), url_(url), timeout_(timeout) {}

  void run(tcp::resolver& resolver) {
    auto self = this->shared_from_this();
    req_.version(11);
    req_.method(http::verb::get);
    req_.target(url_.target);
    req_.set(http::field::host, url_.host);
    req_.set(http::field::user_agent, std::string("wsb/") + kVersion);
    req_.set(http::field::accept, "application/json");

    resolver.async_resolve(url_.host, url_.port,
      [self](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return self->finish(ec, "resolve");
        beast::get_lowest_layer(self->stream_).expires_after(self->timeout_);
        beast::get_lowest_layer(self->stream_).async_connect(results,
          [self](beast::error_code ec2, tcp::endpoint) {
            if (ec2) return self->finish(ec2, "connect");
            self->onConnect();
          });
      });
  }

  beast::error_code ec;
  std::string where;
  http::response<http::string_body> res;

private:
  void onConnect();

  void doWrite() {
    auto self = this->shared_from_this();
    http::async_write(stream_, req_,
      [self](beast::error_code ec, std::size_t) {
        if (ec) return self->finish(ec, "write");
        http::async_read(self->stream_, self->buffer_, self->res,
          [self](beast::error_code ec2, std::size_t) {
            self->finish(ec2, ec2 ? "read" : "");
          });
      });
  }

  void finish(beast::error_code e, const char* w) {
    ec = e;
    where = w;
    beast::error_code ignored;
    beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
  }

  Stream& stream_;
  const Url& url_;
  std::chrono::milliseconds timeout_;
  http::request<http::empty_body> req_;
  beast::flat_buffer buffer_;

};

template <>
void Exchange<beast::tcp_stream>::onConnect() {
  doWrite();
}

template <>
void Exchange<beast::ssl_stream<beast::tcp_stream>>::onConnect() {
  auto self = shared_from_this();
  stream_.async_handshake(ssl::stream_base::client,
    [self](beast::error_code ec) {
      if (ec) return self->finish(ec, "handshake");
      self->doWrite();
    });
}

template <class Stream>
Result<DocumentPtr> complete(const Exchange<Stream>& x, const std::string& url) {
  if (x.ec == beast::error::timeout) {
    return Error{"timed out during " + x.where, url};
  }
  if (x.ec) {
    return Error{x.where + ": " + x.ec.message(), url};
  }

  auto status = x.res.result_int();
  if (status < 200 || status >= 300) {
    return Error{"HTTP status " + std::to_string(status), url};
  }

  std::string perr;
  auto doc = parseDocument(x.res.body(), &perr);
  if (!doc) {
    return Error{"response is not valid JSON: " + perr, url};
  }
  if (!doc->IsObject()) {
    return Error{"response is not a JSON object", url};
  }
  return doc;
}

} // namespace

HttpFetcher::HttpFetcher(const std::string& url, std::chrono::milliseconds timeout)
  : raw_(url)
  , url_(Url::parse(url))
  , timeout_(timeout)
{
  if (timeout_.count() <= 0) {
    throw std::invalid_argument("fetch timeout must be positive");
  }
  if (url_.tls) {
    tls_ = std::make_shared<ssl::context>(ssl::context::tls_client);
    tls_->set_default_verify_paths();
    tls_->set_verify_mode(ssl::verify_peer);
  }
}

Result<DocumentPtr> HttpFetcher::fetch() {
  boost::asio::io_context ioc;
  tcp::resolver resolver(ioc);

  if (!url_.tls) {
    beast::tcp_stream stream(ioc);
    auto x = std::make_shared<Exchange<beast::tcp_stream>>(stream, url_, timeout_);
    x->run(resolver);
    ioc.run();
    return complete(*x, raw_);
  }

  beast::ssl_stream<beast::tcp_stream> stream(ioc, *tls_);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url_.host.c_str())) {
    beast::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
    return Error{"SNI: " + ec.message(), raw_};
  }
  stream.set_verify_callback(ssl::host_name_verification(url_.host));

  auto x = std::make_shared<Exchange<beast::ssl_stream<beast::tcp_stream>>>(stream, url_, timeout_);
  x->run(resolver);
  ioc.run();
  return complete(*x, raw_);
}

} // namespace wsb::net
