#include "wsb/ClientMessage.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace wsb {

ClientMessage parseClientMessage(const std::string& text) {
  ClientMessage out;

  rapidjson::Document doc;
  doc.Parse(text.c_str(), text.size());
  if (doc.HasParseError()) {
    out.error = rapidjson::GetParseError_En(doc.GetParseError());
    return out;
  }
  if (!doc.IsObject()) {
    out.error = "message is not an object";
    return out;
  }

  out.kind = ClientMessage::Kind::Unknown;
  auto t = doc.FindMember("type");
  if (t == doc.MemberEnd() || !t->value.IsString()) {
    return out;
  }
  out.type.assign(t->value.GetString(), t->value.GetStringLength());

  if (out.type == "subscribe") {
    out.kind = ClientMessage::Kind::Subscribe;
    auto e = doc.FindMember("event");
    if (e != doc.MemberEnd() && e->value.IsString()) {
      out.event.assign(e->value.GetString(), e->value.GetStringLength());
    }
  }
  return out;
}

} // namespace wsb
