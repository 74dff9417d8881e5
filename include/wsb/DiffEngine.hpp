#pragma once

#include "wsb/TopicRegistry.hpp"

#include <rapidjson/document.h>

#include <vector>

namespace wsb {

/// True if any of the topic's field paths resolves differently in the two
/// documents. Stops at the first differing field.
bool topicChanged(const TopicSpec& topic,
                  const rapidjson::Value& previous,
                  const rapidjson::Value& next);

/// Topics with at least one changed field, in registry declaration order.
/// Returned pointers refer into `registry`.
std::vector<const TopicSpec*> changedTopics(const rapidjson::Value& previous,
                                            const rapidjson::Value& next,
                                            const TopicRegistry& registry);

} // namespace wsb
