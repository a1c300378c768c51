/**
 * @file proxwatch-poll.cpp
 * @brief Periodic resource collection over a device inventory.
 *
 * Loads the collector configuration and the device inventory, then runs one
 * collection cycle per interval, printing a line per device and appending the
 * records to the daily CSV file. Metric and device failures go to the error log.
 */

#include "src/collector/inc/BlockingTask.hpp"
#include "src/collector/inc/CollectionCycle.hpp"
#include "src/collector/inc/ResourceCollector.hpp"
#include "src/config/inc/ConfigLoader.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/logging/inc/Logging.hpp"
#include "src/report/inc/CsvWriter.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace args = proxwatch::helpers::args;
namespace collector = proxwatch::collector;
namespace config = proxwatch::config;
namespace format = proxwatch::helpers::format;
namespace logging = proxwatch::logging;
namespace report = proxwatch::report;

namespace {

/* ----------------------------- Signal Handling ----------------------------- */

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int /*signum*/) { g_running = 0; }

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_CONFIG = 1,
  ARG_DEVICES = 2,
  ARG_GROUP = 3,
  ARG_INTERVAL = 4,
  ARG_COUNT = 5,
  ARG_CSV_DIR = 6,
  ARG_LOG_DIR = 7,
  ARG_VERBOSE = 8,
  ARG_LOG_LEVEL = 9,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION = "Poll CPU, memory, session and interface counters from a "
                                         "device fleet over SNMPv2c.\n\n"
                                         "Press Ctrl+C to stop.";

/// Default seconds between cycles.
constexpr std::uint64_t DEFAULT_INTERVAL_SEC = 60;

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_CONFIG] = {"--config", 1, false,
                     "Collector configuration (default: config/resource_config.json)"};
  map[ARG_DEVICES] = {"--devices", 1, false, "Device inventory (default: config/proxies.json)"};
  map[ARG_GROUP] = {"--group", 1, false, "Poll only devices of this group"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Seconds between cycles (default: 60)"};
  map[ARG_COUNT] = {"--count", 1, false, "Number of cycles (default: unlimited)"};
  map[ARG_CSV_DIR] = {"--csv-dir", 1, false, "CSV output directory (default: logs)"};
  map[ARG_LOG_DIR] = {"--log-dir", 1, false, "Error log directory (default: logs)"};
  map[ARG_VERBOSE] = {"--verbose", 0, false,
                      "Log per-request details (same as --log-level debug)"};
  map[ARG_LOG_LEVEL] = {"--log-level", 1, false,
                        "Console level: trace, debug, info, warn, error, off (default: info)"};
  return map;
}

/// Poller options after validation.
struct Options {
  std::string configPath{"config/resource_config.json"};
  std::string devicesPath{"config/proxies.json"};
  std::string group{};
  std::uint64_t intervalSec{DEFAULT_INTERVAL_SEC};
  std::uint64_t maxCount{0};
  std::string csvDir{"logs"};
  std::string logDir{"logs"};
  std::string logLevel{"info"};
};

/* ----------------------------- Output ----------------------------- */

void printCycle(const collector::CollectionSnapshot& snap, std::uint64_t cycle,
                const std::vector<std::string>& metricNames) {
  fmt::print("--- cycle {} [{}]", cycle, collector::toString(snap.status));
  if (snap.progress) {
    fmt::print(" {}/{} devices", snap.progress->first, snap.progress->second);
  }
  fmt::print("\n");

  fmt::print("  {:<6} {:<20}", "id", "device");
  for (const std::string& name : metricNames) {
    fmt::print(" {:>9}", name);
  }
  fmt::print("\n");

  for (const collector::ResourceRecord& rec : snap.records) {
    fmt::print("  {:<6} {:<20}", rec.deviceId, rec.displayName());
    if (rec.failed) {
      fmt::print(" FAILED: {}\n", rec.errorMessage);
      continue;
    }
    for (const std::string& name : metricNames) {
      fmt::print(" {:>9}", format::metricOrDash(rec.metric(name)));
    }
    for (const collector::InterfaceTraffic& t : rec.interfaces) {
      fmt::print("  {} in:{} out:{}", t.name, format::bitRate(t.inBps),
                 format::bitRate(t.outBps));
    }
    fmt::print("\n");
  }
  if (!snap.lastError.empty()) {
    fmt::print("  note: {}\n", snap.lastError);
  }
}

/// Sleep in short slices so a signal ends the wait promptly.
void sleepInterruptible(std::chrono::seconds total) {
  constexpr auto SLICE = std::chrono::milliseconds(200);
  const auto DEADLINE = std::chrono::steady_clock::now() + total;
  while (g_running != 0 && std::chrono::steady_clock::now() < DEADLINE) {
    std::this_thread::sleep_for(SLICE);
  }
}

/* ----------------------------- Main Loop ----------------------------- */

int runPoller(const Options& opts) {
  config::CollectorConfig cfg;
  std::string error;
  if (!config::loadCollectorConfig(opts.configPath, cfg, error)) {
    spdlog::error("{}", error);
    return 1;
  }

  std::vector<config::Device> devices;
  if (!config::loadDeviceList(opts.devicesPath, devices, error)) {
    spdlog::error("{}", error);
    return 1;
  }

  devices = config::filterByGroup(devices, opts.group);
  if (devices.empty()) {
    spdlog::error("no devices to poll{}",
                  opts.group.empty() ? std::string{} : fmt::format(" in group '{}'", opts.group));
    return 1;
  }

  spdlog::info("polling {} devices, {} metrics, {} interfaces every {} s", devices.size(),
               cfg.metrics.size(), cfg.interfaces.size(), opts.intervalSec);

  const collector::ResourceCollector COLLECTOR(cfg, collector::snmpClientFactory(cfg));
  report::CsvWriter csv(opts.csvDir, cfg.metricNames(), cfg.interfaceNames());
  collector::CollectionState state;

  std::uint64_t cycle = 0;
  while (g_running != 0 && (opts.maxCount == 0 || cycle < opts.maxCount)) {
    ++cycle;
    if (!collector::runCollectionCycle(COLLECTOR, devices, state, &csv)) {
      spdlog::warn("cycle {} skipped", cycle);
    } else {
      printCycle(state.snapshot(), cycle, COLLECTOR.config().metricNames());
    }

    if (opts.maxCount != 0 && cycle >= opts.maxCount) {
      break;
    }
    sleepInterruptible(std::chrono::seconds(opts.intervalSec));
  }

  fmt::print("\n{} cycles run\n", cycle);

  // Abandoned fetches may still log; let them finish before logging shuts down
  if (!collector::waitForWorkers(cfg.deviceTimeout)) {
    spdlog::warn("{} fetch workers still running at exit", collector::outstandingWorkers());
  }
  return state.status() == collector::CollectionStatus::FAILED ? 2 : 0;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  Options opts;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  if (args::has(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  opts.configPath = std::string(args::valueOr(pargs, ARG_CONFIG, opts.configPath));
  opts.devicesPath = std::string(args::valueOr(pargs, ARG_DEVICES, opts.devicesPath));
  opts.group = std::string(args::valueOr(pargs, ARG_GROUP, ""));
  opts.csvDir = std::string(args::valueOr(pargs, ARG_CSV_DIR, opts.csvDir));
  opts.logDir = std::string(args::valueOr(pargs, ARG_LOG_DIR, opts.logDir));
  if (args::has(pargs, ARG_VERBOSE)) {
    opts.logLevel = "debug";
  }
  opts.logLevel = std::string(args::valueOr(pargs, ARG_LOG_LEVEL, opts.logLevel));

  if (args::has(pargs, ARG_INTERVAL)) {
    if (!args::parseUnsigned(args::valueOr(pargs, ARG_INTERVAL, ""), opts.intervalSec) ||
        opts.intervalSec < 1) {
      fmt::print(stderr, "Error: Interval must be >= 1 s\n");
      return 1;
    }
  }

  if (args::has(pargs, ARG_COUNT)) {
    if (!args::parseUnsigned(args::valueOr(pargs, ARG_COUNT, ""), opts.maxCount) ||
        opts.maxCount < 1) {
      fmt::print(stderr, "Error: Count must be >= 1\n");
      return 1;
    }
  }

  logging::LogConfig logCfg;
  logCfg.name = "proxwatch-poll";
  logCfg.consoleLevel = logging::parseLevel(opts.logLevel);
  logCfg.errorLogDir = opts.logDir;
  if (!logging::initLogging(logCfg, error)) {
    fmt::print(stderr, "Warning: {}\n", error);
  }

  const int RC = runPoller(opts);
  logging::shutdownLogging();
  return RC;
}
