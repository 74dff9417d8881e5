#include "wsb/util/Config.hpp"
#include "wsb/JsonValidator.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>

namespace wsb {
namespace util {

void Config::loadFromFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ConfigError("cannot read config file '" + path + "'");
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  loadFromString(ss.str());
}

void Config::loadFromString(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError()) {
    throw ConfigError(std::string("config is not valid JSON: ") +
                      rapidjson::GetParseError_En(doc.GetParseError()) +
                      " at offset " + std::to_string(doc.GetErrorOffset()));
  }
  if (!doc.IsObject()) {
    throw ConfigError("config root must be an object");
  }

  // Parse into a scratch copy so a failed load leaves *this untouched.
  Config c;
  try {
    c.certPath = JsonValidator::requireString(doc, "certPath");
    c.keyPath  = JsonValidator::requireString(doc, "keyPath");

    long long port = JsonValidator::requirePositiveInt(doc, "port");
    if (port > 65535) throw ConfigError("Invalid or missing 'port': out of range");
    c.port = static_cast<unsigned short>(port);

    c.updateIntervalMs = JsonValidator::requirePositiveInt(doc, "updateInterval");
    c.apiUrl           = JsonValidator::requireString(doc, "apiUrl");

    c.fetchTimeoutMs = JsonValidator::optionalInt(doc, "fetchTimeoutMs", c.fetchTimeoutMs);
    if (c.fetchTimeoutMs <= 0) throw ConfigError("Invalid 'fetchTimeoutMs': must be positive");

    c.requireInitialFetch = JsonValidator::optionalBool(doc, "requireInitialFetch", c.requireInitialFetch);

    long long threads = JsonValidator::optionalInt(doc, "ioThreads", c.ioThreads);
    if (threads <= 0 || threads > 256) throw ConfigError("Invalid 'ioThreads': expected 1..256");
    c.ioThreads = static_cast<unsigned>(threads);

    c.logLevel  = JsonValidator::optionalString(doc, "logLevel", c.logLevel);
    c.logFormat = JsonValidator::optionalString(doc, "logFormat", c.logFormat);
    if (c.logFormat != "text" && c.logFormat != "json") {
      throw ConfigError("Invalid 'logFormat': expected \"text\" or \"json\"");
    }
    c.logFile = JsonValidator::optionalString(doc, "logFile", c.logFile);

    long long mi = JsonValidator::optionalInt(doc, "metricsIntervalSeconds", c.metricsIntervalSeconds);
    if (mi < 0) throw ConfigError("Invalid 'metricsIntervalSeconds': must not be negative");
    c.metricsIntervalSeconds = static_cast<unsigned>(mi);

    const auto& events = JsonValidator::requireObject(doc, "events");
    for (auto it = events.MemberBegin(); it != events.MemberEnd(); ++it) {
      const std::string name = it->name.GetString();
      if (!it->value.IsObject()) {
        throw ConfigError("Invalid event '" + name + "': expected an object");
      }
      std::string emit = JsonValidator::optionalString(it->value, "emitEvent", name);
      if (emit.empty()) throw ConfigError("Invalid event '" + name + "': 'emitEvent' is empty");
      auto params = JsonValidator::requireStringArray(it->value, "params");
      c.topics.add(name, emit, params);
    }
  } catch (const ConfigError&) {
    throw;
  } catch (const std::exception& e) {
    throw ConfigError(e.what());
  }

  *this = std::move(c);
}

} // namespace util
} // namespace wsb
