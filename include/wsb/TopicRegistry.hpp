#pragma once

#include "wsb/Document.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace wsb {

/// A configured event: when any of `fields` changes, an event named
/// `emitName` is sent to clients subscribed to `name`.
struct TopicSpec {
  std::string name;
  std::string emitName;
  std::vector<FieldPath> fields;
};

/// Static, ordered set of topics. Iteration follows declaration order.
class TopicRegistry {
public:
  /// Reserved subscribe keyword; never a valid topic name.
  static constexpr const char* kAll = "all";

  /// Throws std::invalid_argument on an empty/duplicate/reserved name,
  /// an empty field list or a malformed field path. Duplicate paths
  /// within one topic are dropped (first occurrence kept). An empty
  /// emitName defaults to the topic name.
  void add(const std::string& name,
           const std::string& emitName,
           const std::vector<std::string>& fields);

  const TopicSpec* find(const std::string& name) const;
  bool contains(const std::string& name) const { return find(name) != nullptr; }

  const std::vector<TopicSpec>& topics() const { return _topics; }
  std::size_t size() const { return _topics.size(); }
  bool empty() const { return _topics.empty(); }

private:
  std::vector<TopicSpec> _topics;
  std::unordered_map<std::string, std::size_t> _index;
};

} // namespace wsb
