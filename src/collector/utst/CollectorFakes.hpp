#ifndef PROXWATCH_COLLECTOR_UTST_COLLECTOR_FAKES_HPP
#define PROXWATCH_COLLECTOR_UTST_COLLECTOR_FAKES_HPP
/**
 * @file CollectorFakes.hpp
 * @brief Scriptable SNMP getter and SSH source for collector tests.
 */

#include "src/collector/inc/SshMetricSource.hpp"
#include "src/config/inc/Device.hpp"
#include "src/snmp/inc/SnmpClient.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fmt/core.h>

namespace proxwatch {

namespace collector {

namespace test {

/**
 * Getter answering from a table keyed by (host, oid), falling back to oid only.
 * Unknown OIDs answer TIMEOUT immediately.
 */
class FakeGetter final : public snmp::SnmpGetter {
public:
  struct Reply {
    snmp::SnmpResult result{};
    std::chrono::milliseconds delay{0};
    bool throws{false};
    bool throwsForeign{false}; ///< Throw a non-std::exception value
  };

  static Reply value(double v) { return Reply{snmp::SnmpResult::success(v)}; }
  static Reply counter(std::uint64_t c) { return Reply{snmp::SnmpResult::successCounter(c)}; }
  static Reply error(snmp::SnmpStatus s) { return Reply{snmp::SnmpResult::failure(s, "scripted")}; }
  static Reply slow(double v, std::chrono::milliseconds d) {
    return Reply{snmp::SnmpResult::success(v), d};
  }
  static Reply throwing() {
    Reply r;
    r.throws = true;
    return r;
  }

  static Reply throwingForeign() {
    Reply r;
    r.throwsForeign = true;
    return r;
  }

  void set(const std::string& oid, Reply reply) {
    std::lock_guard<std::mutex> lock(mtx_);
    byOid_[oid] = std::move(reply);
  }

  void set(const std::string& host, const std::string& oid, Reply reply) {
    std::lock_guard<std::mutex> lock(mtx_);
    byHostOid_[{host, oid}] = std::move(reply);
  }

  [[nodiscard]] snmp::SnmpResult get(const std::string& host,
                                     const std::string& oid) const override {
    ++calls_;
    Reply reply = lookup(host, oid);
    if (reply.delay.count() > 0) {
      std::this_thread::sleep_for(reply.delay);
    }
    if (reply.throws) {
      throw std::runtime_error("scripted failure");
    }
    if (reply.throwsForeign) {
      throw 42;
    }
    return reply.result;
  }

  [[nodiscard]] int calls() const noexcept { return calls_.load(); }

private:
  Reply lookup(const std::string& host, const std::string& oid) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto HIT = byHostOid_.find({host, oid});
    if (HIT != byHostOid_.end()) {
      return HIT->second;
    }
    const auto IT = byOid_.find(oid);
    if (IT != byOid_.end()) {
      return IT->second;
    }
    return Reply{snmp::SnmpResult::failure(snmp::SnmpStatus::TIMEOUT, "no such OID scripted")};
  }

  mutable std::mutex mtx_;
  std::map<std::string, Reply> byOid_;
  std::map<std::pair<std::string, std::string>, Reply> byHostOid_;
  mutable std::atomic<int> calls_{0};
};

/**
 * SSH source returning a fixed percentage, or failing.
 */
class FakeSsh final : public SshMetricSource {
public:
  explicit FakeSsh(double percent, bool ok = true) : percent_(percent), ok_(ok) {}

  [[nodiscard]] bool getMemoryPercent(const config::Device& device, std::chrono::milliseconds,
                                      double& percent, std::string& error) const override {
    if (!ok_) {
      error = fmt::format("ssh scripted failure for {}", device.host);
      return false;
    }
    percent = percent_;
    return true;
  }

private:
  double percent_;
  bool ok_;
};

/// Device with id and host.
inline config::Device makeDevice(std::uint32_t id, std::string host) {
  config::Device d;
  d.id = id;
  d.host = std::move(host);
  return d;
}

} // namespace test

} // namespace collector

} // namespace proxwatch

#endif // PROXWATCH_COLLECTOR_UTST_COLLECTOR_FAKES_HPP
