#pragma once

#include <boost/asio/ssl/context.hpp>

#include <memory>
#include <string>

namespace wsb::server {

/// Server-side TLS context from PEM files. Throws std::runtime_error if
/// either file is unreadable or the material is rejected by OpenSSL.
std::shared_ptr<boost::asio::ssl::context>
makeServerTlsContext(const std::string& certPath, const std::string& keyPath);

} // namespace wsb::server
