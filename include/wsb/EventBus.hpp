#pragma once

#include "wsb/TopicRegistry.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wsb {

using SubscriptionHandle = std::uint64_t;
using OwnerId = std::uint64_t;

// A projected payload, shared by every listener of one publish.
using Payload = std::shared_ptr<const rapidjson::Document>;

/// In-process topic -> listener registry with synchronous fan-out.
class EventBus {
public:
  using Listener = std::function<void(const TopicSpec& topic, const Payload& payload)>;

  EventBus() = default;
  EventBus(const EventBus&)            = delete;
  EventBus& operator=(const EventBus&) = delete;

  /// Register `listener` for `topic` on behalf of `owner`. Handles are
  /// non-zero and never reused.
  SubscriptionHandle subscribe(const std::string& topic, OwnerId owner, Listener listener);

  /// Remove one binding. Unknown or already removed handles are a no-op.
  bool unsubscribe(SubscriptionHandle handle);

  /// Remove every binding held by `owner`; returns how many were removed.
  std::size_t unsubscribeOwner(OwnerId owner);

  /// Deliver to every listener bound to topic.name, in registration order.
  /// A listener that throws is logged, its owner is unsubscribed, and
  /// delivery continues. Returns the number of successful deliveries.
  std::size_t publish(const TopicSpec& topic, const Payload& payload);

  std::size_t listenerCount(const std::string& topic) const;
  std::size_t size() const;

private:
  struct Binding {
    SubscriptionHandle handle;
    OwnerId owner;
    std::string topic;
    std::shared_ptr<Listener> listener;
  };

  mutable std::mutex _mutex;
  std::vector<Binding> _bindings;   // registration order
  SubscriptionHandle _next{1};
};

} // namespace wsb
