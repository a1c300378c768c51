/**
 * @file CollectionCycle.cpp
 * @brief Collection cycle orchestration and dashboard state.
 */

#include "src/collector/inc/CollectionCycle.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace proxwatch {

namespace collector {

/* ----------------------------- CollectionStatus ----------------------------- */

const char* toString(CollectionStatus status) noexcept {
  switch (status) {
  case CollectionStatus::IDLE:
    return "Idle";
  case CollectionStatus::STARTING:
    return "Starting";
  case CollectionStatus::COLLECTING:
    return "Collecting";
  case CollectionStatus::SUCCESS:
    return "Success";
  case CollectionStatus::FAILED:
    return "Failed";
  }
  return "Unknown";
}

/* ----------------------------- CollectionState Methods ----------------------------- */

CollectionSnapshot CollectionState::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return data_;
}

CollectionStatus CollectionState::status() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return data_.status;
}

bool CollectionState::isCollecting() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return data_.collecting;
}

bool CollectionState::tryBegin(std::size_t total) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (data_.collecting) {
    return false;
  }
  data_.collecting = true;
  data_.status = CollectionStatus::STARTING;
  data_.lastError.clear();
  data_.progress = Progress{0, total};
  return true;
}

void CollectionState::setStatus(CollectionStatus status) {
  std::lock_guard<std::mutex> lock(mtx_);
  data_.status = status;
}

void CollectionState::setProgress(std::optional<Progress> progress) {
  std::lock_guard<std::mutex> lock(mtx_);
  data_.progress = progress;
}

void CollectionState::finish(CollectionStatus status, std::optional<Progress> progress,
                             std::vector<ResourceRecord> records, std::string lastError) {
  std::lock_guard<std::mutex> lock(mtx_);
  data_.status = status;
  data_.progress = progress;
  data_.records = std::move(records);
  data_.lastError = std::move(lastError);
  data_.lastCollectionTime = std::chrono::system_clock::now();
}

void CollectionState::release() {
  std::lock_guard<std::mutex> lock(mtx_);
  data_.collecting = false;
}

void CollectionState::appendError(const std::string& message) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (data_.lastError.empty()) {
    data_.lastError = message;
  } else {
    data_.lastError += "; " + message;
  }
}

/* ----------------------------- Cycle ----------------------------- */

bool runCollectionCycle(const ResourceCollector& collector,
                        const std::vector<config::Device>& devices, CollectionState& state,
                        RecordSink* sink) {
  if (devices.empty()) {
    spdlog::debug("collection skipped: no devices selected");
    return false;
  }
  if (!state.tryBegin(devices.size())) {
    spdlog::debug("collection skipped: previous cycle still running");
    return false;
  }

  // Released on every exit path, including a throwing sink
  struct Release {
    CollectionState& state;
    ~Release() { state.release(); }
  } release{state};

  const std::uint64_t START_NS = helpers::clock::getMonotonicNs();
  state.setStatus(CollectionStatus::COLLECTING);

  FleetCollection fleet =
      collector.collectFleet(devices, [&state](std::size_t done, std::size_t total) {
        state.setProgress(Progress{done, total});
      });

  const std::size_t TOTAL = devices.size();
  const std::size_t FAILED = fleet.failedCount();
  const std::size_t SUCCEEDED = fleet.succeededCount();
  const double ELAPSED_SEC =
      static_cast<double>(helpers::clock::getMonotonicNs() - START_NS) / 1'000'000'000.0;

  // Kept for the sink; the state takes its own copy
  const std::vector<ResourceRecord> RECORDS = fleet.records;

  if (fleet.ok) {
    std::string warning;
    if (FAILED > 0) {
      warning = fmt::format("partial collection failure ({} succeeded, {} failed)", SUCCEEDED,
                            FAILED);
      spdlog::warn("{}", warning);
    }
    spdlog::info("collection finished: {}/{} devices in {:.2f} s", SUCCEEDED, TOTAL, ELAPSED_SEC);
    state.finish(CollectionStatus::SUCCESS, Progress{SUCCEEDED, TOTAL}, std::move(fleet.records),
                 std::move(warning));
  } else {
    spdlog::error("collection failed: {}", fleet.error);
    state.finish(CollectionStatus::FAILED, std::nullopt, std::move(fleet.records),
                 std::move(fleet.error));
  }

  if (sink != nullptr) {
    std::string error;
    if (!sink->save(RECORDS, error)) {
      spdlog::error("CSV save failed: {}", error);
      state.appendError(fmt::format("CSV save failed: {}", error));
    }
  }

  return true;
}

} // namespace collector

} // namespace proxwatch
