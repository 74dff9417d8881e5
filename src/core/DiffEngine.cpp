#include "wsb/DiffEngine.hpp"

namespace wsb {

bool topicChanged(const TopicSpec& topic,
                  const rapidjson::Value& previous,
                  const rapidjson::Value& next)
{
  for (const auto& path : topic.fields) {
    if (!sameValue(resolvePath(previous, path), resolvePath(next, path))) {
      return true;
    }
  }
  return false;
}

std::vector<const TopicSpec*> changedTopics(const rapidjson::Value& previous,
                                            const rapidjson::Value& next,
                                            const TopicRegistry& registry)
{
  std::vector<const TopicSpec*> out;
  if (&previous == &next) return out;

  for (const auto& topic : registry.topics()) {
    if (topicChanged(topic, previous, next)) {
      out.push_back(&topic);
    }
  }
  return out;
}

} // namespace wsb
