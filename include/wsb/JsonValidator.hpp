#pragma once
#include <rapidjson/document.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace wsb {

class JsonValidator {
public:
  // Each helper throws std::runtime_error naming `name` when the member is
  // missing or has the wrong shape.
  static const rapidjson::Value& requireObject(const rapidjson::Value& v, const char* name);
  static std::string requireString(const rapidjson::Value& v, const char* name);
  static long long requirePositiveInt(const rapidjson::Value& v, const char* name);

  // Returns `fallback` when the member is absent; throws when present but malformed.
  static std::string optionalString(const rapidjson::Value& v, const char* name, const std::string& fallback);
  static long long optionalInt(const rapidjson::Value& v, const char* name, long long fallback);
  static bool optionalBool(const rapidjson::Value& v, const char* name, bool fallback);

  static std::vector<std::string> requireStringArray(const rapidjson::Value& v, const char* name);
};

} // namespace wsb
