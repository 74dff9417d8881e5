#pragma once

#include "wsb/EventBus.hpp"
#include "wsb/Fetcher.hpp"
#include "wsb/SnapshotStore.hpp"
#include "wsb/TopicRegistry.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace wsb {

struct TickOutcome {
  enum class Kind { Failed, Seeded, Published };
  Kind kind = Kind::Failed;
  std::size_t published = 0;   // topics published this tick
};

/// Fetches the upstream document on a fixed period and publishes the
/// topics whose fields changed.
class Poller {
public:
  /// Throws std::invalid_argument if period is not positive or fetcher is null.
  Poller(std::shared_ptr<IFetcher> fetcher,
         const TopicRegistry& registry,
         SnapshotStore& snapshots,
         EventBus& bus,
         std::chrono::milliseconds period);
  ~Poller();

  Poller(const Poller&)            = delete;
  Poller& operator=(const Poller&) = delete;

  /// Initial fetch: seeds the snapshot without publishing.
  Result<DocumentPtr> prime();

  /// One fetch/diff/publish/swap cycle. Never throws on fetch errors.
  TickOutcome tick();

  /// Run tick() on a background thread every period (fixed rate).
  void start();
  void stop() noexcept;
  bool running() const;

  std::chrono::milliseconds period() const { return _period; }

private:
  Result<DocumentPtr> fetchOnce();
  void loop();

  std::shared_ptr<IFetcher> _fetcher;
  const TopicRegistry& _registry;
  SnapshotStore& _snapshots;
  EventBus& _bus;
  std::chrono::milliseconds _period;

  mutable std::mutex _runMu;
  std::condition_variable _runCv;
  bool _running{false};
  std::thread _thread;
};

} // namespace wsb
