#pragma once

#include "wsb/Fetcher.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace wsb::net {

struct Url {
  bool tls = false;
  std::string host;
  std::string port;     // numeric, defaults to 80 / 443
  std::string target;   // path + query, defaults to "/"

  /// Throws std::invalid_argument for anything but http:// or https://
  /// with a non-empty host.
  static Url parse(const std::string& url);
};

/// GETs a JSON document over HTTP or HTTPS with Boost.Beast.
/// Each fetch uses a fresh connection and a private io_context, so a slow
/// upstream only blocks the caller.
class HttpFetcher final : public IFetcher {
public:
  HttpFetcher(const std::string& url, std::chrono::milliseconds timeout);

  Result<DocumentPtr> fetch() override;

  const Url& url() const { return url_; }

private:
  std::string raw_;
  Url url_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<boost::asio::ssl::context> tls_;
};

} // namespace wsb::net
