#pragma once

#include <string>

namespace wsb {

/// One decoded inbound client frame.
struct ClientMessage {
  enum class Kind {
    Malformed,   // not JSON, or not a JSON object
    Unknown,     // object without a recognised "type"
    Subscribe
  };

  Kind kind = Kind::Malformed;
  std::string type;    // raw "type" value when it was a string
  std::string event;   // Subscribe: topic name or "all"; empty if missing
  std::string error;   // Malformed: parser message
};

ClientMessage parseClientMessage(const std::string& text);

} // namespace wsb
