// File: src/main.cpp
#include <cstdlib>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "mvr/ServiceContext.hpp"
#include "mvr/ingest/DirectoryScanner.hpp"
#include "mvr/rt/PeriodicTask.hpp"
#include "mvr/rt/ShutdownCoordinator.hpp"
#include "mvr/rt/ThreadPool.hpp"
#include "mvr/server/HttpEndpoints.hpp"
#include "mvr/server/WebSocketServer.hpp"
#include "mvr/session/SessionManager.hpp"
#include "mvr/store/TimeSeriesStore.hpp"
#include "mvr/store/TimeframeCache.hpp"
#include "mvr/util/Config.hpp"
#include "mvr/util/Logger.hpp"
#include "mvr/util/Metrics.hpp"
#include "mvr/ws/RequestRouter.hpp"

namespace {

std::string joined(const std::vector<std::string>& v) {
  std::string out;
  for (const auto& s : v) {
    if (!out.empty()) out += ',';
    out += s;
  }
  return out;
}

void configureLogger(const mvr::util::Config& cfg) {
  auto& log = mvr::util::logger();
  log.setLevel(mvr::util::parseLevel(cfg.logLevel));
  log.setFormatJson(cfg.logJson);
  if (!cfg.logFile.empty() && !log.setFile(cfg.logFile)) {
    log.log(mvr::util::LogLevel::Warn, "log.file.unavailable", {{"path", cfg.logFile}});
  }
}

} // namespace

// usage: mvr_server [config-file]
int main(int argc, char* argv[]) {
  using namespace mvr;
  using util::logger;
  using util::LogLevel;

  // ---------------------------
  // 1) Config: defaults < file < environment
  // ---------------------------
  util::Config cfg;
  const bool fileRead = argc > 1 && cfg.loadFromFile(argv[1]);
  cfg.applyEnv();
  configureLogger(cfg);
  if (argc > 1 && !fileRead) {
    logger().log(LogLevel::Warn, "config.file.unreadable", {{"path", argv[1]}});
  }

  logger().log(LogLevel::Info, "boot", {
    {"port", std::to_string(cfg.port)},
    {"version", cfg.version},
    {"data_dirs", joined(cfg.dataDirs)},
    {"origins", joined(cfg.allowedOrigins)}
  });

  if (cfg.metricsIntervalSeconds > 0) {
    util::MetricRegistry::instance().startReporter(static_cast<unsigned>(cfg.metricsIntervalSeconds));
  }

  // ---------------------------
  // 2) Core components
  // ---------------------------
  store::TimeSeriesStore store;
  store::TimeframeCache cache(std::chrono::seconds(cfg.cacheTtlSeconds));
  session::SessionManager sessions;

  try {
    store.load(cfg.dataDirs);
  } catch (const ingest::ScanError& ex) {
    logger().log(LogLevel::Error, "store.preload.failed", {{"what", ex.what()}});
  }

  rt::ThreadPool pool(static_cast<unsigned>(cfg.workerThreads > 0 ? cfg.workerThreads : 1));
  ws::RequestRouter router(store, cache, sessions, cfg.dataDirs);
  server::HttpEndpoints http(cfg.version, cfg.allowedOrigins);
  ServiceContext ctx(&router, &sessions, &http, &pool);

  std::unique_ptr<rt::PeriodicTask> reloader;
  if (cfg.reloadMinutes > 0) {
    reloader = std::make_unique<rt::PeriodicTask>(
      "reload", std::chrono::minutes(cfg.reloadMinutes),
      [&store, &cache, dirs = cfg.dataDirs] {
        try {
          store.load(dirs);
          cache.reset();
        } catch (const ingest::ScanError& ex) {
          logger().log(LogLevel::Error, "store.reload.failed", {{"what", ex.what()}});
        }
      });
    reloader->start();
  }

  // ---------------------------
  // 3) ASIO + server
  // ---------------------------
  boost::asio::io_context ioc;
  std::unique_ptr<server::WebSocketServer> wss;
  try {
    wss = std::make_unique<server::WebSocketServer>(ioc, &ctx, "0.0.0.0", cfg.port);
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "server.bind.failed", {{"port", std::to_string(cfg.port)}, {"what", ex.what()}});
    return EXIT_FAILURE;
  }
  wss->run();

  // ---------------------------
  // 4) Shutdown sequencing
  // ---------------------------
  rt::ShutdownCoordinator shutdown;
  shutdown.registerStep("ws-stop-accept",    5,  [&]{ wss->stopAccept(); });
  shutdown.registerStep("ws-close-sessions", 10, [&]{ wss->closeAll(); });
  shutdown.registerStep("reloader-stop",     20, [&]{ if (reloader) reloader->stop(); });
  shutdown.registerStep("pool-shutdown",     30, [&]{ pool.shutdown(); });
  shutdown.registerStep("metrics-stop",      40, []{ util::MetricRegistry::instance().stopReporter(); });
  shutdown.registerStep("asio-stop",         50, [&]{ ioc.stop(); });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal", {{"signal", std::to_string(sig)}});
    shutdown.stop();
  });

  // ---------------------------
  // 5) Run
  // ---------------------------
  const int ioThreads = cfg.ioThreads > 0 ? cfg.ioThreads : 1;
  std::vector<std::thread> io;
  io.reserve(static_cast<std::size_t>(ioThreads - 1));
  auto runIo = [&ioc] {
    try {
      ioc.run();
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "io_context.exception", {{"what", ex.what()}});
    }
  };
  for (int i = 1; i < ioThreads; ++i) io.emplace_back(runIo);
  runIo();
  for (auto& t : io) t.join();

  // Natural exit (io_context ran out of work) still runs every step once.
  shutdown.stop();

  logger().log(LogLevel::Info, "stopped", {});
  return EXIT_SUCCESS;
}
