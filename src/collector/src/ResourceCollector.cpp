/**
 * @file ResourceCollector.cpp
 * @brief Per-device fetch and fleet fan-out on detached worker threads.
 */

#include "src/collector/inc/ResourceCollector.hpp"
#include "src/collector/inc/BlockingTask.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <optional>
#include <system_error>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace proxwatch {

namespace collector {

/// State shared with worker threads.
struct ResourceCollector::Context {
  config::CollectorConfig cfg;
  GetterFactory getters;
  std::shared_ptr<const SshMetricSource> ssh;
  std::shared_ptr<RateCache> cache;
};

namespace {

using Clock = std::chrono::steady_clock;

/* ----------------------------- Fetch Outcome ----------------------------- */

/// Result of one metric or counter fetch.
struct FetchOutcome {
  bool ok{false};
  double value{0.0};
  std::optional<std::uint64_t> counter{};
  std::string error{};
};

FetchOutcome fromSnmp(const snmp::SnmpResult& res) {
  FetchOutcome out;
  out.ok = res.ok();
  if (out.ok) {
    out.value = res.value;
    if (res.isCounter) {
      out.counter = res.counter;
    } else if (res.value >= 0.0) {
      out.counter = static_cast<std::uint64_t>(res.value);
    }
  } else {
    out.error = res.toString();
  }
  return out;
}

/**
 * One dispatched fetch: what it is for and when to stop waiting.
 */
struct PendingFetch {
  std::string label; ///< Metric key or "<ifname>/in"
  std::string oid;   ///< OID text or "ssh"
  std::future<FetchOutcome> fut;
  Clock::time_point deadline;
};

/**
 * Await one fetch against its deadline. Failures are logged and yield nullopt.
 */
std::optional<FetchOutcome> settle(PendingFetch& p, const config::Device& device,
                                   std::chrono::milliseconds bound) {
  if (p.fut.wait_until(p.deadline) != std::future_status::ready) {
    spdlog::warn("{} [{}]: {} timed out after {} ms (OID {})", device.host, device.id, p.label,
                 bound.count(), p.oid);
    return std::nullopt;
  }

  try {
    FetchOutcome out = p.fut.get();
    if (!out.ok) {
      spdlog::warn("{} [{}]: {} failed (OID {}): {}", device.host, device.id, p.label, p.oid,
                   out.error);
      return std::nullopt;
    }
    return out;
  } catch (const std::exception& ex) {
    spdlog::warn("{} [{}]: {} task failed (OID {}): {}", device.host, device.id, p.label, p.oid,
                 ex.what());
    return std::nullopt;
  } catch (...) {
    spdlog::warn("{} [{}]: {} task failed (OID {}): unknown exception", device.host, device.id,
                 p.label, p.oid);
    return std::nullopt;
  }
}

/**
 * Dispatch an SNMP GET; a thread-creation failure is logged and skipped.
 */
bool dispatchSnmp(std::vector<PendingFetch>& pending,
                  const std::shared_ptr<const snmp::SnmpGetter>& getter,
                  const config::Device& device, std::string label, const std::string& oid,
                  std::chrono::milliseconds bound) {
  if (!getter) {
    spdlog::warn("{} [{}]: {} skipped (OID {}): no SNMP getter", device.host, device.id, label,
                 oid);
    return false;
  }
  try {
    auto fut = spawnBlocking(
        [getter, host = device.host, oid]() { return fromSnmp(getter->get(host, oid)); });
    pending.push_back(PendingFetch{std::move(label), oid, std::move(fut), deadlineAfter(bound)});
    return true;
  } catch (const std::system_error& ex) {
    spdlog::warn("{} [{}]: {} not started (OID {}): {}", device.host, device.id, label, oid,
                 ex.what());
    return false;
  }
}

/* ----------------------------- Per-Device Fetch ----------------------------- */

/**
 * Fetch one device. Rates are only fed to the cache while deviceDeadline has not
 * passed, so an abandoned worker never overwrites a newer cycle's baseline.
 */
ResourceRecord collectWith(const ResourceCollector::Context& ctx, const config::Device& device,
                           Clock::time_point deviceDeadline) {
  const config::CollectorConfig& CFG = ctx.cfg;
  const std::shared_ptr<const snmp::SnmpGetter> GETTER =
      ctx.getters ? ctx.getters(device) : nullptr;

  // Metrics
  std::vector<PendingFetch> metrics;
  metrics.reserve(CFG.metrics.size());
  for (const config::MetricSpec& spec : CFG.metrics) {
    if (const auto* OID = std::get_if<config::SnmpOid>(&spec.source)) {
      dispatchSnmp(metrics, GETTER, device, spec.name, OID->oid, CFG.taskTimeout);
      continue;
    }

    if (!ctx.ssh) {
      spdlog::warn("{} [{}]: {} skipped: no SSH source configured", device.host, device.id,
                   spec.name);
      continue;
    }
    try {
      auto fut = spawnBlocking([ssh = ctx.ssh, device, timeout = CFG.snmpTimeout]() {
        FetchOutcome out;
        out.ok = ssh->getMemoryPercent(device, timeout, out.value, out.error);
        return out;
      });
      metrics.push_back(
          PendingFetch{spec.name, "ssh", std::move(fut), deadlineAfter(CFG.taskTimeout)});
    } catch (const std::system_error& ex) {
      spdlog::warn("{} [{}]: {} not started (ssh): {}", device.host, device.id, spec.name,
                   ex.what());
    }
  }

  // Interface counters, one fetch per configured direction
  struct CounterPair {
    std::optional<std::size_t> in;
    std::optional<std::size_t> out;
  };
  std::vector<PendingFetch> counters;
  std::map<std::string, CounterPair> slots;
  for (const auto& [name, oids] : CFG.interfaces) {
    CounterPair& slot = slots[name];
    if (!oids.inOid.empty() &&
        dispatchSnmp(counters, GETTER, device, name + "/in", oids.inOid, CFG.taskTimeout)) {
      slot.in = counters.size() - 1;
    }
    if (!oids.outOid.empty() &&
        dispatchSnmp(counters, GETTER, device, name + "/out", oids.outOid, CFG.taskTimeout)) {
      slot.out = counters.size() - 1;
    }
  }

  ResourceRecord rec;
  rec.deviceId = device.id;
  rec.host = device.host;
  rec.alias = device.alias;
  rec.configuredMetrics = CFG.metrics.size();

  for (PendingFetch& p : metrics) {
    if (const auto OUT = settle(p, device, CFG.taskTimeout)) {
      rec.metrics.push_back(MetricValue{p.label, OUT->value});
    }
  }

  std::vector<std::optional<std::uint64_t>> counterValues(counters.size());
  for (std::size_t i = 0; i < counters.size(); ++i) {
    if (const auto OUT = settle(counters[i], device, CFG.taskTimeout)) {
      counterValues[i] = OUT->counter;
    }
  }

  // Rates, in interface name order
  const double NOW_SEC = helpers::clock::getMonotonicSec();
  if (Clock::now() >= deviceDeadline) {
    spdlog::debug("{} [{}]: device deadline passed, counters not cached", device.host, device.id);
    slots.clear();
  }
  for (const auto& [name, slot] : slots) {
    const std::optional<std::uint64_t> IN = slot.in ? counterValues[*slot.in] : std::nullopt;
    const std::optional<std::uint64_t> OUT = slot.out ? counterValues[*slot.out] : std::nullopt;
    if (!IN && !OUT) {
      continue;
    }
    if (auto traffic = ctx.cache->update(device.id, name, IN, OUT, NOW_SEC)) {
      rec.interfaces.push_back(std::move(*traffic));
    }
  }

  rec.collectedAt = std::chrono::system_clock::now();
  rec.failed = isCollectionFailed(rec.configuredMetrics, rec.metrics.size());
  if (rec.failed) {
    rec.errorMessage = fmt::format("all {} configured metrics failed", rec.configuredMetrics);
  }
  return rec;
}

} // namespace

/* ----------------------------- FleetCollection Methods ----------------------------- */

std::size_t FleetCollection::failedCount() const noexcept {
  return static_cast<std::size_t>(std::count_if(
      records.begin(), records.end(), [](const ResourceRecord& r) { return r.failed; }));
}

/* ----------------------------- Factories ----------------------------- */

GetterFactory snmpClientFactory(const config::CollectorConfig& cfg) {
  return [community = cfg.community, timeout = cfg.snmpTimeout,
          port = cfg.snmpPort](const config::Device& device) {
    snmp::SnmpClientConfig clientCfg;
    clientCfg.community = device.community.empty() ? community : device.community;
    clientCfg.timeout = timeout;
    clientCfg.port = port;
    return std::shared_ptr<const snmp::SnmpGetter>(
        std::make_shared<snmp::SnmpClient>(std::move(clientCfg)));
  };
}

GetterFactory fixedGetter(std::shared_ptr<const snmp::SnmpGetter> getter) {
  return [getter = std::move(getter)](const config::Device&) { return getter; };
}

/* ----------------------------- ResourceCollector Methods ----------------------------- */

ResourceCollector::ResourceCollector(config::CollectorConfig cfg, GetterFactory getters,
                                     std::shared_ptr<const SshMetricSource> ssh,
                                     std::shared_ptr<RateCache> cache)
    : ctx_(std::make_shared<Context>(Context{std::move(cfg), std::move(getters), std::move(ssh),
                                             cache ? std::move(cache) : RateCache::shared()})) {}

const config::CollectorConfig& ResourceCollector::config() const noexcept { return ctx_->cfg; }

ResourceRecord ResourceCollector::collectDevice(const config::Device& device) const {
  return collectWith(*ctx_, device, Clock::time_point::max());
}

FleetCollection ResourceCollector::collectFleet(const std::vector<config::Device>& devices,
                                                const ProgressCallback& progress) const {
  FleetCollection fleet;
  if (devices.empty()) {
    return fleet;
  }

  const std::chrono::milliseconds BOUND = ctx_->cfg.deviceTimeout;
  const std::size_t CONFIGURED = ctx_->cfg.metrics.size();

  struct PendingDevice {
    const config::Device* device;
    std::optional<std::future<ResourceRecord>> fut;
    Clock::time_point deadline;
    std::string startError;
  };

  std::vector<PendingDevice> pending;
  pending.reserve(devices.size());
  for (const config::Device& device : devices) {
    PendingDevice p{&device, std::nullopt, deadlineAfter(BOUND), {}};
    try {
      p.fut = spawnBlocking([ctx = ctx_, device, deadline = p.deadline]() {
        return collectWith(*ctx, device, deadline);
      });
    } catch (const std::system_error& ex) {
      p.startError = ex.what();
    }
    pending.push_back(std::move(p));
  }

  std::size_t completed = 0;
  fleet.records.reserve(devices.size());
  for (PendingDevice& p : pending) {
    const config::Device& device = *p.device;

    if (!p.fut) {
      fleet.records.push_back(failedRecord(
          device, CONFIGURED, fmt::format("collection task failed: {}", p.startError)));
    } else if (p.fut->wait_until(p.deadline) != std::future_status::ready) {
      fleet.records.push_back(failedRecord(
          device, CONFIGURED, fmt::format("collection timed out after {} ms", BOUND.count())));
    } else {
      try {
        fleet.records.push_back(p.fut->get());
      } catch (const std::exception& ex) {
        fleet.records.push_back(failedRecord(
            device, CONFIGURED, fmt::format("collection task failed: {}", ex.what())));
      } catch (...) {
        fleet.records.push_back(
            failedRecord(device, CONFIGURED, "collection task failed: unknown exception"));
      }
    }

    const ResourceRecord& rec = fleet.records.back();
    if (rec.failed) {
      spdlog::error("{} [{}]: collection failed: {}", device.host, device.id, rec.errorMessage);
    }

    ++completed;
    if (progress) {
      progress(completed, devices.size());
    }
  }

  std::stable_sort(fleet.records.begin(), fleet.records.end(),
                   [](const ResourceRecord& a, const ResourceRecord& b) {
                     return a.deviceId < b.deviceId;
                   });

  if (fleet.failedCount() == fleet.records.size()) {
    fleet.ok = false;
    fleet.error = fmt::format("all {} devices failed (first error: {})", fleet.records.size(),
                              fleet.records.front().errorMessage);
  }
  return fleet;
}

} // namespace collector

} // namespace proxwatch
