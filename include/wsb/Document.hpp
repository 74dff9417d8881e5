#pragma once

#include <rapidjson/document.h>

#include <memory>
#include <string>
#include <vector>

namespace wsb {

// One fetched upstream snapshot. Never mutated after it is published.
using DocumentPtr = std::shared_ptr<const rapidjson::Document>;

/// A dot-separated path into a Document, split into its key segments.
class FieldPath {
public:
  FieldPath() = default;

  /// Parse "a.b.c". Throws std::invalid_argument on an empty path or an
  /// empty segment ("a..b", ".a", "a.").
  static FieldPath parse(const std::string& dotted);

  const std::vector<std::string>& segments() const { return segments_; }
  const std::string& str() const { return dotted_; }
  std::size_t depth() const { return segments_.size(); }

  bool operator==(const FieldPath& o) const { return dotted_ == o.dotted_; }
  bool operator!=(const FieldPath& o) const { return !(*this == o); }

private:
  std::vector<std::string> segments_;
  std::string dotted_;
};

/// Walk nested object keys. Returns nullptr ("absent") when any segment is
/// missing or an intermediate value is not an object.
const rapidjson::Value* resolvePath(const rapidjson::Value& root, const FieldPath& path);

/// Deep value equality with absent semantics: two absents are equal,
/// absent never equals a present value (including JSON null).
bool sameValue(const rapidjson::Value* a, const rapidjson::Value* b);

/// Parse a JSON text into an immutable document.
/// Returns nullptr if the text is not valid JSON.
DocumentPtr parseDocument(const std::string& text, std::string* error = nullptr);

/// A document holding an empty object.
DocumentPtr emptyDocument();

std::string toJson(const rapidjson::Value& v);

} // namespace wsb
