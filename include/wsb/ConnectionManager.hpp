#pragma once

#include "wsb/EventBus.hpp"
#include "wsb/SnapshotStore.hpp"
#include "wsb/TopicRegistry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace wsb {

using ConnectionId = OwnerId;

/// Tracks live client connections, pushes the snapshot on connect and binds
/// subscribe requests to the EventBus.
class ConnectionManager {
public:
  // Sends one text frame to the client. Must serialise writes itself and
  // throw std::runtime_error once the connection is gone.
  using SendFn = std::function<void(const std::string&)>;

  enum class State { Connected, Subscribed, Closed };

  ConnectionManager(const TopicRegistry& registry,
                    const SnapshotStore& snapshots,
                    EventBus& bus);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&)            = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  /// Allocate a process-unique connection id.
  ConnectionId nextId();

  /// Register the connection and send it one "dataUpdate" with the
  /// current snapshot.
  void onOpen(ConnectionId id, SendFn send);

  /// Handle one inbound text frame. Bad input is logged and ignored.
  void onMessage(ConnectionId id, const std::string& text);

  /// Drop every subscription of the connection. Idempotent.
  void onClose(ConnectionId id);

  /// Closed for ids that were never opened or are gone.
  State state(ConnectionId id) const;
  std::set<std::string> topics(ConnectionId id) const;
  std::size_t connectionCount() const;

private:
  struct Conn {
    SendFn send;
    std::atomic<bool> closed{false};  // set by onClose; listeners skip sends
    std::set<std::string> topics;
    std::vector<SubscriptionHandle> handles;
  };

  void subscribe(ConnectionId id, const std::string& event);
  bool bind(ConnectionId id, const TopicSpec& topic);

  const TopicRegistry& registry_;
  const SnapshotStore& snapshots_;
  EventBus& bus_;

  mutable std::mutex mx_;
  std::unordered_map<ConnectionId, std::shared_ptr<Conn>> conns_;
  std::uint64_t nextId_{1};
};

const char* stateName(ConnectionManager::State s);

} // namespace wsb
