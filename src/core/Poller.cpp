#include "wsb/Poller.hpp"
#include "wsb/DiffEngine.hpp"
#include "wsb/Projector.hpp"
#include "wsb/util/Logger.hpp"
#include "wsb/util/Metrics.hpp"

#include <exception>
#include <stdexcept>

namespace wsb {

using util::LogLevel;
using util::logger;

Poller::Poller(std::shared_ptr<IFetcher> fetcher,
               const TopicRegistry& registry,
               SnapshotStore& snapshots,
               EventBus& bus,
               std::chrono::milliseconds period)
  : _fetcher(std::move(fetcher))
  , _registry(registry)
  , _snapshots(snapshots)
  , _bus(bus)
  , _period(period)
{
  if (!_fetcher) throw std::invalid_argument("poller needs a fetcher");
  if (_period.count() <= 0) throw std::invalid_argument("poll period must be positive");
}

Poller::~Poller() {
  stop();
}

Result<DocumentPtr> Poller::fetchOnce() {
  try {
    auto r = _fetcher->fetch();
    if (r && !*r) return Error{"fetcher returned no document", ""};
    return r;
  } catch (const std::exception& e) {
    return Error{e.what(), ""};
  }
}

Result<DocumentPtr> Poller::prime() {
  auto r = fetchOnce();
  if (!r) {
    WSB_METRIC_HIT("poll.fail");
    logger().log(LogLevel::Error, "initial fetch failed", {{"error", r.error().describe()}});
    return r;
  }
  _snapshots.replace(*r);
  WSB_METRIC_HIT("poll.ok");
  logger().log(LogLevel::Info, "initial snapshot loaded");
  return r;
}

TickOutcome Poller::tick() {
  TickOutcome out;

  auto r = fetchOnce();
  if (!r) {
    WSB_METRIC_HIT("poll.fail");
    logger().log(LogLevel::Error, "error updating API data", {{"error", r.error().describe()}});
    return out;
  }
  WSB_METRIC_HIT("poll.ok");

  DocumentPtr next = *r;
  if (!_snapshots.hasSnapshot()) {
    _snapshots.replace(std::move(next));
    out.kind = TickOutcome::Kind::Seeded;
    logger().log(LogLevel::Info, "first snapshot seeded");
    return out;
  }

  DocumentPtr prev = _snapshots.current();
  auto changed = changedTopics(*prev, *next, _registry);

  for (const TopicSpec* topic : changed) {
    auto payload = std::make_shared<rapidjson::Document>(project(*topic, *next));
    std::size_t n = _bus.publish(*topic, payload);
    logger().log(LogLevel::Debug, "topic changed",
                 {{"topic", topic->name}, {"listeners", std::to_string(n)}});
  }

  _snapshots.replace(std::move(next));

  out.kind = TickOutcome::Kind::Published;
  out.published = changed.size();
  WSB_METRIC_INC("poll.topics_changed", static_cast<double>(changed.size()));
  return out;
}

void Poller::start() {
  std::lock_guard<std::mutex> lk(_runMu);
  if (_running) return;
  _running = true;
  _thread = std::thread([this]{ loop(); });
  logger().log(LogLevel::Info, "poller started", {{"periodMs", std::to_string(_period.count())}});
}

void Poller::stop() noexcept {
  {
    std::lock_guard<std::mutex> lk(_runMu);
    if (!_running && !_thread.joinable()) return;
    _running = false;
  }
  _runCv.notify_all();
  if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id()) {
    _thread.join();
  }
}

bool Poller::running() const {
  std::lock_guard<std::mutex> lk(_runMu);
  return _running;
}

void Poller::loop() {
  auto next = std::chrono::steady_clock::now() + _period;

  std::unique_lock<std::mutex> lk(_runMu);
  while (_running) {
    if (_runCv.wait_until(lk, next, [this]{ return !_running; })) break;

    lk.unlock();
    try {
      tick();
    } catch (const std::exception& e) {
      logger().log(LogLevel::Error, "poll tick aborted", {{"error", e.what()}});
    }
    lk.lock();

    // fixed rate; skip deadlines that already passed during a slow fetch
    auto now = std::chrono::steady_clock::now();
    next += _period;
    while (next <= now) next += _period;
  }
}

} // namespace wsb
