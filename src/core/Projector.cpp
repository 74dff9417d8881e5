#include "wsb/Projector.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace wsb {

namespace {

// Return the object stored under `key` in `obj`, creating it (or replacing a
// null) as needed. Returns nullptr when another field already wrote a
// non-null, non-object value there.
rapidjson::Value* childObject(rapidjson::Value& obj,
                              const std::string& key,
                              rapidjson::Document::AllocatorType& alloc)
{
  auto it = obj.FindMember(rapidjson::StringRef(key.data(), static_cast<rapidjson::SizeType>(key.size())));
  if (it != obj.MemberEnd()) {
    if (it->value.IsNull()) it->value.SetObject();
    return it->value.IsObject() ? &it->value : nullptr;
  }
  rapidjson::Value k(key.data(), static_cast<rapidjson::SizeType>(key.size()), alloc);
  obj.AddMember(k, rapidjson::Value(rapidjson::kObjectType), alloc);
  return &(obj.MemberEnd() - 1)->value;
}

void setLeaf(rapidjson::Value& obj,
             const std::string& key,
             const rapidjson::Value* value,
             rapidjson::Document::AllocatorType& alloc)
{
  rapidjson::Value copy;
  if (value) copy.CopyFrom(*value, alloc);

  auto it = obj.FindMember(rapidjson::StringRef(key.data(), static_cast<rapidjson::SizeType>(key.size())));
  if (it != obj.MemberEnd()) {
    // an earlier, deeper path already built an object here; keep it
    if (!value && it->value.IsObject()) return;
    it->value = copy;
    return;
  }
  rapidjson::Value k(key.data(), static_cast<rapidjson::SizeType>(key.size()), alloc);
  obj.AddMember(k, copy, alloc);
}

} // namespace

rapidjson::Document project(const TopicSpec& topic, const rapidjson::Value& doc) {
  rapidjson::Document out(rapidjson::kObjectType);
  auto& alloc = out.GetAllocator();

  for (const auto& path : topic.fields) {
    const auto& segs = path.segments();
    rapidjson::Value* cur = &out;
    for (std::size_t i = 0; cur && i + 1 < segs.size(); ++i) {
      cur = childObject(*cur, segs[i], alloc);
    }
    if (!cur) continue;  // shadowed by a scalar from an earlier field
    setLeaf(*cur, segs.back(), resolvePath(doc, path), alloc);
  }
  return out;
}

std::string buildSnapshotMessage(const rapidjson::Value& doc) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("type");
  w.String(kSnapshotType);
  w.Key("data");
  doc.Accept(w);
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

std::string buildEventMessage(const TopicSpec& topic, const rapidjson::Value& payload) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("type");
  w.String(topic.emitName.c_str(), static_cast<rapidjson::SizeType>(topic.emitName.size()));
  if (payload.IsObject()) {
    for (auto m = payload.MemberBegin(); m != payload.MemberEnd(); ++m) {
      if (m->name == "type") continue;
      w.Key(m->name.GetString(), m->name.GetStringLength());
      m->value.Accept(w);
    }
  }
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace wsb
