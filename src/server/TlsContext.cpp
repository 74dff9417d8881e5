#include "wsb/server/TlsContext.hpp"

#include <boost/system/system_error.hpp>

#include <fstream>
#include <stdexcept>

namespace wsb::server {

namespace ssl = boost::asio::ssl;

static void requireReadable(const std::string& path, const char* what) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error(std::string("SSL ") + what + " file not found or not readable: " + path);
  }
}

std::shared_ptr<ssl::context>
makeServerTlsContext(const std::string& certPath, const std::string& keyPath) {
  requireReadable(certPath, "certificate");
  requireReadable(keyPath, "key");

  auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
  ctx->set_options(ssl::context::default_workarounds |
                   ssl::context::no_sslv2 |
                   ssl::context::no_sslv3 |
                   ssl::context::single_dh_use);

  try {
    ctx->use_certificate_chain_file(certPath);
    ctx->use_private_key_file(keyPath, ssl::context::pem);
  } catch (const boost::system::system_error& e) {
    throw std::runtime_error(std::string("invalid SSL certificate or key: ") + e.what());
  }
  return ctx;
}

} // namespace wsb::server
