#include "wsb/EventBus.hpp"
#include "wsb/util/Logger.hpp"
#include "wsb/util/Metrics.hpp"

#include <algorithm>
#include <exception>

namespace wsb {

SubscriptionHandle EventBus::subscribe(const std::string& topic, OwnerId owner, Listener listener) {
  std::lock_guard<std::mutex> lock(_mutex);
  SubscriptionHandle h = _next++;
  _bindings.push_back(Binding{h, owner, topic, std::make_shared<Listener>(std::move(listener))});
  return h;
}

bool EventBus::unsubscribe(SubscriptionHandle handle) {
  std::lock_guard<std::mutex> lock(_mutex);
  auto it = std::find_if(_bindings.begin(), _bindings.end(),
                         [handle](const Binding& b) { return b.handle == handle; });
  if (it == _bindings.end()) return false;
  _bindings.erase(it);
  return true;
}

std::size_t EventBus::unsubscribeOwner(OwnerId owner) {
  std::lock_guard<std::mutex> lock(_mutex);
  auto before = _bindings.size();
  _bindings.erase(std::remove_if(_bindings.begin(), _bindings.end(),
                                 [owner](const Binding& b) { return b.owner == owner; }),
                  _bindings.end());
  return before - _bindings.size();
}

std::size_t EventBus::publish(const TopicSpec& topic, const Payload& payload) {
  // Snapshot the bindings for this topic; listeners run outside the lock
  std::vector<std::pair<OwnerId, std::shared_ptr<Listener>>> targets;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto& b : _bindings) {
      if (b.topic == topic.name) targets.emplace_back(b.owner, b.listener);
    }
  }

  WSB_METRIC_HIT("bus.publish");

  std::size_t delivered = 0;
  for (auto& [owner, fn] : targets) {
    try {
      (*fn)(topic, payload);
      ++delivered;
    } catch (const std::exception& e) {
      WSB_METRIC_HIT("bus.listener_error");
      util::logger().log(util::LogLevel::Warn, "listener failed, dropping its subscriptions",
                         {{"topic", topic.name}, {"owner", std::to_string(owner)}, {"error", e.what()}});
      unsubscribeOwner(owner);
    }
  }

  WSB_METRIC_INC("bus.delivered", static_cast<double>(delivered));
  return delivered;
}

std::size_t EventBus::listenerCount(const std::string& topic) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return static_cast<std::size_t>(std::count_if(_bindings.begin(), _bindings.end(),
                                                [&topic](const Binding& b) { return b.topic == topic; }));
}

std::size_t EventBus::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _bindings.size();
}

} // namespace wsb
