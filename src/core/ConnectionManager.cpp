#include "wsb/ConnectionManager.hpp"
#include "wsb/ClientMessage.hpp"
#include "wsb/Projector.hpp"
#include "wsb/util/Logger.hpp"
#include "wsb/util/Metrics.hpp"

#include <exception>

namespace wsb {

using util::LogLevel;
using util::logger;

const char* stateName(ConnectionManager::State s) {
  switch (s) {
    case ConnectionManager::State::Connected:  return "connected";
    case ConnectionManager::State::Subscribed: return "subscribed";
    case ConnectionManager::State::Closed:     return "closed";
  }
  return "closed";
}

ConnectionManager::ConnectionManager(const TopicRegistry& registry,
                                     const SnapshotStore& snapshots,
                                     EventBus& bus)
  : registry_(registry)
  , snapshots_(snapshots)
  , bus_(bus)
{}

ConnectionManager::~ConnectionManager() {
  std::unordered_map<ConnectionId, std::shared_ptr<Conn>> tmp;
  {
    std::lock_guard<std::mutex> lk(mx_);
    tmp.swap(conns_);
  }
  for (auto& kv : tmp) {
    kv.second->closed.store(true, std::memory_order_release);
    bus_.unsubscribeOwner(kv.first);
  }
}

ConnectionId ConnectionManager::nextId() {
  std::lock_guard<std::mutex> lk(mx_);
  return nextId_++;
}

void ConnectionManager::onOpen(ConnectionId id, SendFn send) {
  auto c = std::make_shared<Conn>();
  c->send = std::move(send);
  std::size_t total = 0;
  {
    std::lock_guard<std::mutex> lk(mx_);
    conns_[id] = c;
    total = conns_.size();
  }

  WSB_METRIC_HIT("conn.open");
  WSB_METRIC_SET("conn.active", static_cast<double>(total));
  logger().log(LogLevel::Info, "client connected", {{"conn", std::to_string(id)}});

  // Snapshot push happens before any subscribe can be processed for this id
  auto snap = snapshots_.current();
  try {
    c->send(buildSnapshotMessage(*snap));
  } catch (const std::exception& e) {
    logger().log(LogLevel::Warn, "snapshot push failed",
                 {{"conn", std::to_string(id)}, {"error", e.what()}});
    onClose(id);
  }
}

void ConnectionManager::onMessage(ConnectionId id, const std::string& text) {
  util::Logger::Scoped ctx({{"conn", std::to_string(id)}});

  {
    std::lock_guard<std::mutex> lk(mx_);
    if (!conns_.count(id)) {
      logger().log(LogLevel::Debug, "message for unknown connection ignored");
      return;
    }
  }

  ClientMessage msg = parseClientMessage(text);
  switch (msg.kind) {
    case ClientMessage::Kind::Malformed:
      WSB_METRIC_HIT("conn.msg_bad");
      logger().log(LogLevel::Warn, "invalid JSON message received", {{"error", msg.error}});
      return;

    case ClientMessage::Kind::Unknown:
      WSB_METRIC_HIT("conn.msg_unknown");
      logger().log(LogLevel::Warn, "unknown message type", {{"type", msg.type}});
      return;

    case ClientMessage::Kind::Subscribe:
      subscribe(id, msg.event);
      return;
  }
}

void ConnectionManager::subscribe(ConnectionId id, const std::string& event) {
  if (event == TopicRegistry::kAll) {
    std::size_t added = 0;
    for (const auto& topic : registry_.topics()) {
      if (bind(id, topic)) ++added;
    }
    logger().log(LogLevel::Info, "client subscribed to all events", {{"added", std::to_string(added)}});
    return;
  }

  const TopicSpec* topic = registry_.find(event);
  if (!topic) {
    WSB_METRIC_HIT("conn.subscribe_unknown");
    logger().log(LogLevel::Warn, "unknown event type", {{"event", event}});
    return;
  }

  if (bind(id, *topic)) {
    logger().log(LogLevel::Info, "client subscribed to event", {{"event", event}});
  } else {
    logger().log(LogLevel::Debug, "already subscribed", {{"event", event}});
  }
}

bool ConnectionManager::bind(ConnectionId id, const TopicSpec& topic) {
  // Held across bus_.subscribe so a concurrent onClose can't miss the binding.
  std::lock_guard<std::mutex> lk(mx_);
  auto it = conns_.find(id);
  if (it == conns_.end()) return false;

  auto& c = *it->second;
  if (!c.topics.insert(topic.name).second) return false;

  // The listener runs outside both locks. A publish that snapshotted this
  // binding before onClose removed it must not reach the closed session.
  std::weak_ptr<Conn> weak = it->second;
  c.handles.push_back(bus_.subscribe(topic.name, id,
      [this, id, weak](const TopicSpec& t, const Payload& payload) {
        auto conn = weak.lock();
        if (!conn || conn->closed.load(std::memory_order_acquire)) return;
        try {
          conn->send(buildEventMessage(t, *payload));
        } catch (const std::exception&) {
          // Close first so state and bindings agree; the bus logs and counts.
          onClose(id);
          throw;
        }
      }));
  WSB_METRIC_HIT("conn.subscribe");
  return true;
}

void ConnectionManager::onClose(ConnectionId id) {
  std::shared_ptr<Conn> c;
  std::size_t total = 0;
  {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = conns_.find(id);
    if (it == conns_.end()) return;
    c = std::move(it->second);
    conns_.erase(it);
    total = conns_.size();
  }
  c->closed.store(true, std::memory_order_release);

  std::size_t removed = 0;
  for (auto h : c->handles) {
    if (bus_.unsubscribe(h)) ++removed;
  }

  WSB_METRIC_HIT("conn.close");
  WSB_METRIC_SET("conn.active", static_cast<double>(total));
  logger().log(LogLevel::Info, "client disconnected",
               {{"conn", std::to_string(id)}, {"unsubscribed", std::to_string(removed)}});
}

ConnectionManager::State ConnectionManager::state(ConnectionId id) const {
  std::lock_guard<std::mutex> lk(mx_);
  auto it = conns_.find(id);
  if (it == conns_.end()) return State::Closed;
  return it->second->topics.empty() ? State::Connected : State::Subscribed;
}

std::set<std::string> ConnectionManager::topics(ConnectionId id) const {
  std::lock_guard<std::mutex> lk(mx_);
  auto it = conns_.find(id);
  if (it == conns_.end()) return {};
  return it->second->topics;
}

std::size_t ConnectionManager::connectionCount() const {
  std::lock_guard<std::mutex> lk(mx_);
  return conns_.size();
}

} // namespace wsb
