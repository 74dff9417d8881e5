#pragma once

#include "wsb/TopicRegistry.hpp"

#include <rapidjson/document.h>

#include <string>

namespace wsb {

/// Wire type of the full-state message pushed on connect.
inline constexpr const char* kSnapshotType = "dataUpdate";

/// Copy only the topic's field paths out of `doc`, keeping their nesting.
/// A path that does not resolve is written as null.
rapidjson::Document project(const TopicSpec& topic, const rapidjson::Value& doc);

/// {"type":"dataUpdate","data":<doc>}
std::string buildSnapshotMessage(const rapidjson::Value& doc);

/// {"type":<emitName>, ...payload members}. A payload member named "type"
/// is not copied.
std::string buildEventMessage(const TopicSpec& topic, const rapidjson::Value& payload);

} // namespace wsb
