#include "wsb/TopicRegistry.hpp"

#include <algorithm>
#include <stdexcept>

namespace wsb {

void TopicRegistry::add(const std::string& name,
                        const std::string& emitName,
                        const std::vector<std::string>& fields)
{
  if (name.empty()) {
    throw std::invalid_argument("topic name is empty");
  }
  if (name == kAll) {
    throw std::invalid_argument("topic name 'all' is reserved");
  }
  if (_index.count(name)) {
    throw std::invalid_argument("duplicate topic '" + name + "'");
  }
  if (fields.empty()) {
    throw std::invalid_argument("topic '" + name + "' has no fields");
  }

  TopicSpec topic;
  topic.name = name;
  topic.emitName = emitName.empty() ? name : emitName;
  topic.fields.reserve(fields.size());

  for (const auto& f : fields) {
    FieldPath p;
    try {
      p = FieldPath::parse(f);
    } catch (const std::invalid_argument& e) {
      throw std::invalid_argument("topic '" + name + "': " + e.what());
    }
    if (std::find(topic.fields.begin(), topic.fields.end(), p) == topic.fields.end()) {
      topic.fields.push_back(std::move(p));
    }
  }

  _index.emplace(name, _topics.size());
  _topics.push_back(std::move(topic));
}

const TopicSpec* TopicRegistry::find(const std::string& name) const {
  auto it = _index.find(name);
  if (it == _index.end()) return nullptr;
  return &_topics[it->second];
}

} // namespace wsb
