#include "wsb/JsonValidator.hpp"

#include <stdexcept>
#include <string>

namespace wsb {

namespace {

[[noreturn]] void fail(const char* name, const char* what) {
  throw std::runtime_error(std::string("Invalid or missing '") + name + "': " + what);
}

} // namespace

const rapidjson::Value& JsonValidator::requireObject(const rapidjson::Value& v, const char* name) {
  if (!v.IsObject() || !v.HasMember(name)) fail(name, "expected an object");
  const auto& m = v[name];
  if (!m.IsObject()) fail(name, "expected an object");
  return m;
}

std::string JsonValidator::requireString(const rapidjson::Value& v, const char* name) {
  if (!v.IsObject() || !v.HasMember(name) || !v[name].IsString()) {
    fail(name, "expected a string");
  }
  std::string s = v[name].GetString();
  if (s.empty()) fail(name, "must not be empty");
  return s;
}

long long JsonValidator::requirePositiveInt(const rapidjson::Value& v, const char* name) {
  if (!v.IsObject() || !v.HasMember(name) || !v[name].IsInt64()) {
    fail(name, "expected an integer");
  }
  long long n = v[name].GetInt64();
  if (n <= 0) fail(name, "must be positive");
  return n;
}

std::string JsonValidator::optionalString(const rapidjson::Value& v, const char* name, const std::string& fallback) {
  if (!v.IsObject() || !v.HasMember(name)) return fallback;
  if (!v[name].IsString()) fail(name, "expected a string");
  return v[name].GetString();
}

long long JsonValidator::optionalInt(const rapidjson::Value& v, const char* name, long long fallback) {
  if (!v.IsObject() || !v.HasMember(name)) return fallback;
  if (!v[name].IsInt64()) fail(name, "expected an integer");
  return v[name].GetInt64();
}

bool JsonValidator::optionalBool(const rapidjson::Value& v, const char* name, bool fallback) {
  if (!v.IsObject() || !v.HasMember(name)) return fallback;
  if (!v[name].IsBool()) fail(name, "expected a boolean");
  return v[name].GetBool();
}

std::vector<std::string> JsonValidator::requireStringArray(const rapidjson::Value& v, const char* name) {
  if (!v.IsObject() || !v.HasMember(name) || !v[name].IsArray()) {
    fail(name, "expected an array of strings");
  }
  std::vector<std::string> out;
  for (const auto& e : v[name].GetArray()) {
    if (!e.IsString()) fail(name, "expected an array of strings");
    out.emplace_back(e.GetString(), e.GetStringLength());
  }
  if (out.empty()) fail(name, "must not be empty");
  return out;
}

} // namespace wsb
