// File: src/main.cpp
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "wsb/ConnectionManager.hpp"
#include "wsb/EventBus.hpp"
#include "wsb/Poller.hpp"
#include "wsb/SnapshotStore.hpp"
#include "wsb/Version.hpp"
#include "wsb/net/HttpFetcher.hpp"
#include "wsb/runtime/ShutdownCoordinator.hpp"
#include "wsb/server/TlsContext.hpp"
#include "wsb/server/WebSocketServer.hpp"
#include "wsb/util/Config.hpp"
#include "wsb/util/Logger.hpp"
#include "wsb/util/Metrics.hpp"

using wsb::util::LogLevel;
using wsb::util::logger;

static wsb::rt::ShutdownCoordinator gShutdown;

// Run the io_context until it is stopped; a handler that throws is logged
// and the loop resumes.
static void runIo(boost::asio::io_context& ioc) {
  for (;;) {
    try {
      ioc.run();
      return;
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "io_context exception", {{"error", ex.what()}});
    }
  }
}

int main(int argc, char* argv[]) {
  // ---------------------------
  // 1) Config: argv[1] = config file path
  // ---------------------------
  const std::string cfgPath = argc > 1 ? argv[1] : wsb::util::Config::kDefaultPath;

  wsb::util::Config cfg;
  try {
    cfg.loadFromFile(cfgPath);
  } catch (const wsb::util::ConfigError& e) {
    logger().log(LogLevel::Error, "Failed to start WebSocket bridge",
                 {{"config", cfgPath}, {"error", e.what()}});
    return EXIT_FAILURE;
  }

  // ---------------------------
  // 2) Logger + metrics
  // ---------------------------
  logger().setLevel(wsb::util::parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logFormat == "json");
  if (!logger().setFile(cfg.logFile)) {
    logger().log(LogLevel::Warn, "cannot open log file, using stdout", {{"file", cfg.logFile}});
  }

  logger().log(LogLevel::Info, "boot",
               {{"version", wsb::kVersion},
                {"port", std::to_string(cfg.port)},
                {"topics", std::to_string(cfg.topics.size())},
                {"updateIntervalMs", std::to_string(cfg.updateIntervalMs)}});

  if (cfg.metricsIntervalSeconds > 0) {
    wsb::util::MetricRegistry::instance().startReporter(cfg.metricsIntervalSeconds);
    gShutdown.registerStep("metrics-stop", 70, []{ wsb::util::MetricRegistry::instance().stopReporter(); });
  }

  // ---------------------------
  // 3) Core + collaborators. Anything thrown here is startup-fatal.
  // ---------------------------
  boost::asio::io_context ioc;
  auto work = boost::asio::make_work_guard(ioc);

  wsb::SnapshotStore snapshots;
  wsb::EventBus bus;
  wsb::ConnectionManager manager(cfg.topics, snapshots, bus);

  std::unique_ptr<wsb::Poller> poller;
  std::unique_ptr<wsb::server::WebSocketServer> ws;

  try {
    auto tls = wsb::server::makeServerTlsContext(cfg.certPath, cfg.keyPath);

    auto fetcher = std::make_shared<wsb::net::HttpFetcher>(
        cfg.apiUrl, std::chrono::milliseconds(cfg.fetchTimeoutMs));

    poller = std::make_unique<wsb::Poller>(
        fetcher, cfg.topics, snapshots, bus, std::chrono::milliseconds(cfg.updateIntervalMs));

    auto primed = poller->prime();
    if (!primed) {
      if (cfg.requireInitialFetch) {
        throw std::runtime_error("Failed to fetch API data: " + primed.error().describe());
      }
      logger().log(LogLevel::Warn, "starting without initial snapshot");
    }

    ws = std::make_unique<wsb::server::WebSocketServer>(ioc, tls, cfg.port, &manager);
  } catch (const std::exception& e) {
    logger().log(LogLevel::Error, "Failed to start WebSocket bridge", {{"error", e.what()}});
    wsb::util::MetricRegistry::instance().stopReporter();
    return EXIT_FAILURE;
  }

  ws->run();
  poller->start();

  // ---------------------------
  // 4) Shutdown sequencing
  // ---------------------------
  gShutdown.registerStep("ws-stop-accept",    5,  [&ws]{ ws->stopAccept(); });
  gShutdown.registerStep("poller-stop",       10, [&poller]{ poller->stop(); });
  gShutdown.registerStep("ws-close-sessions", 40, [&ws]{ ws->closeAll(); });
  gShutdown.registerStep("asio-release",      60, [&work]{ work.reset(); });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&ioc](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal received, stopping", {{"signal", std::to_string(sig)}});
    gShutdown.stop();
    // sessions get a grace period to finish their close handshake
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc, std::chrono::seconds(2));
    timer->async_wait([timer, &ioc](const boost::system::error_code&) { ioc.stop(); });
  });

  logger().log(LogLevel::Info, "WebSocket bridge is running");

  // ---------------------------
  // 5) Run
  // ---------------------------
  std::vector<std::thread> io;
  for (unsigned i = 1; i < cfg.ioThreads; ++i) {
    io.emplace_back([&ioc]{ runIo(ioc); });
  }
  runIo(ioc);
  for (auto& t : io) t.join();

  // Ensure shutdown steps run even on natural exit
  gShutdown.stop();

  logger().log(LogLevel::Info, "WebSocket server stopped");
  return EXIT_SUCCESS;
}
