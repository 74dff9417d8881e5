#include "wsb/util/Metrics.hpp"
#include "wsb/util/Logger.hpp"

#include <chrono>
#include <sstream>
#include <vector>

namespace wsb {
namespace util {

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  stopReporter();

  {
    std::lock_guard<std::mutex> lk(runMu_);
    running_ = true;
  }
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds > 0 ? intervalSeconds : 10);
  });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(runMu_);
    running_ = false;
  }
  runCv_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  const auto period = std::chrono::seconds(intervalSeconds);

  std::unique_lock<std::mutex> run(runMu_);
  while (running_) {
    if (runCv_.wait_for(run, period, [this]{ return !running_; })) break;

    std::vector<Field> fields;
    {
      std::lock_guard<std::mutex> lk(mu_);
      for (auto& kv : counters_) {
        std::ostringstream v; v << kv.second;
        fields.push_back({kv.first, v.str()});
      }
      for (auto& kv : gauges_) {
        std::ostringstream v; v << kv.second;
        fields.push_back({kv.first, v.str()});
      }
    }
    if (!fields.empty()) {
      logger().log(LogLevel::Info, "metrics", fields);
    }
  }
}

} // namespace util
} // namespace wsb
