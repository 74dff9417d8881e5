#include "wsb/Document.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>

namespace wsb {

FieldPath FieldPath::parse(const std::string& dotted) {
  if (dotted.empty()) {
    throw std::invalid_argument("field path is empty");
  }

  FieldPath p;
  std::string::size_type start = 0;
  for (;;) {
    auto dot = dotted.find('.', start);
    std::string seg = dotted.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    if (seg.empty()) {
      throw std::invalid_argument("field path '" + dotted + "' has an empty segment");
    }
    p.segments_.push_back(std::move(seg));
    if (dot == std::string::npos) break;
    start = dot + 1;
  }
  p.dotted_ = dotted;
  return p;
}

const rapidjson::Value* resolvePath(const rapidjson::Value& root, const FieldPath& path) {
  const rapidjson::Value* cur = &root;
  for (const auto& seg : path.segments()) {
    if (!cur->IsObject()) return nullptr;
    auto it = cur->FindMember(rapidjson::StringRef(seg.data(), static_cast<rapidjson::SizeType>(seg.size())));
    if (it == cur->MemberEnd()) return nullptr;
    cur = &it->value;
  }
  return cur;
}

bool sameValue(const rapidjson::Value* a, const rapidjson::Value* b) {
  if (a == nullptr || b == nullptr) return a == b;
  return *a == *b;
}

DocumentPtr parseDocument(const std::string& text, std::string* error) {
  auto doc = std::make_shared<rapidjson::Document>();
  doc->Parse(text.c_str(), text.size());
  if (doc->HasParseError()) {
    if (error) {
      *error = std::string(rapidjson::GetParseError_En(doc->GetParseError())) +
               " at offset " + std::to_string(doc->GetErrorOffset());
    }
    return nullptr;
  }
  return doc;
}

DocumentPtr emptyDocument() {
  auto doc = std::make_shared<rapidjson::Document>();
  doc->SetObject();
  return doc;
}

std::string toJson(const rapidjson::Value& v) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  v.Accept(w);
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace wsb
