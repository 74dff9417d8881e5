#pragma once

#include "wsb/TopicRegistry.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wsb {
namespace util {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Config {
public:
  static constexpr const char* kDefaultPath = "/app/config/config.json";

  Config() = default;

  // Load from a JSON file. Throws ConfigError if the file can't be read or
  // any required key is missing or invalid.
  void loadFromFile(const std::string& path);
  void loadFromString(const std::string& json);

  // --- TLS listener ---
  std::string certPath;
  std::string keyPath;
  unsigned short port = 0;

  // --- upstream ---
  std::string apiUrl;
  std::int64_t updateIntervalMs = 0;
  std::int64_t fetchTimeoutMs = 10000;
  bool requireInitialFetch = true;

  // --- runtime ---
  unsigned ioThreads = 1;
  std::string logLevel = "info";
  std::string logFormat = "text";   // "text" | "json"
  std::string logFile;              // empty -> stdout
  unsigned metricsIntervalSeconds = 0;

  TopicRegistry topics;
};

} // namespace util
} // namespace wsb
