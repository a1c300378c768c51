#ifndef PROXWATCH_COLLECTOR_COLLECTION_CYCLE_HPP
#define PROXWATCH_COLLECTOR_COLLECTION_CYCLE_HPP
/**
 * @file CollectionCycle.hpp
 * @brief One fleet collection cycle and the state a dashboard reads from it.
 * @note Thread-safe: CollectionState is mutex-guarded; readers take snapshots.
 *
 * Status moves Idle -> Starting -> Collecting -> Success | Failed. A cycle with
 * at least one successful device is a Success (with a warning naming the
 * failures); only a cycle in which every device failed is Failed.
 */

#include "src/collector/inc/ResourceCollector.hpp"
#include "src/collector/inc/ResourceRecord.hpp"
#include "src/config/inc/Device.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace proxwatch {

namespace collector {

/* ----------------------------- CollectionStatus ----------------------------- */

/**
 * @brief Dashboard-visible phase of the last cycle.
 */
enum class CollectionStatus : std::uint8_t {
  IDLE = 0,   ///< No cycle has run
  STARTING,   ///< Cycle accepted, nothing dispatched yet
  COLLECTING, ///< Devices are being polled
  SUCCESS,    ///< At least one device succeeded
  FAILED,     ///< Every device failed
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(CollectionStatus status) noexcept;

/* ----------------------------- RecordSink ----------------------------- */

/**
 * @brief Destination for the records of a finished cycle (e.g. CSV).
 */
class RecordSink {
public:
  virtual ~RecordSink() = default;

  /**
   * @brief Persist one cycle's records.
   * @return false with error set on failure; the cycle result is unaffected.
   */
  [[nodiscard]] virtual bool save(const std::vector<ResourceRecord>& records,
                                  std::string& error) = 0;
};

/* ----------------------------- CollectionState ----------------------------- */

/// (completed, total) device counts.
using Progress = std::pair<std::size_t, std::size_t>;

/**
 * @brief Copy of the cycle state at one instant.
 */
struct CollectionSnapshot {
  CollectionStatus status{CollectionStatus::IDLE};
  std::optional<Progress> progress{};
  std::vector<ResourceRecord> records{}; ///< Records of the last finished cycle
  std::string lastError{};               ///< Last error or partial-failure warning
  std::optional<std::chrono::system_clock::time_point> lastCollectionTime{};
  bool collecting{false};
};

/**
 * @brief Mutex-guarded cycle state shared between the poller and its readers.
 */
class CollectionState {
public:
  /// @brief Consistent copy of the whole state.
  [[nodiscard]] CollectionSnapshot snapshot() const;

  [[nodiscard]] CollectionStatus status() const;
  [[nodiscard]] bool isCollecting() const;

  /**
   * @brief Claim the state for a new cycle.
   * @return false if a cycle is already running.
   *
   * On success: collecting set, status Starting, last error cleared,
   * progress (0, total).
   */
  [[nodiscard]] bool tryBegin(std::size_t total);

  void setStatus(CollectionStatus status);
  void setProgress(std::optional<Progress> progress);

  /**
   * @brief Publish the outcome of a fan-out and stamp the collection time.
   */
  void finish(CollectionStatus status, std::optional<Progress> progress,
              std::vector<ResourceRecord> records, std::string lastError);

  /// @brief Clear the collecting flag so the next cycle may begin.
  void release();

  /// @brief Append a message to the last error ("; " separated).
  void appendError(const std::string& message);

private:
  mutable std::mutex mtx_;
  CollectionSnapshot data_;
};

/* ----------------------------- Cycle ----------------------------- */

/**
 * @brief Run one collection cycle over devices and publish it into state.
 * @param collector Collector to use.
 * @param devices Devices to poll.
 * @param state State to update.
 * @param sink Optional sink receiving the records; its failure is appended to the
 *        last error as "CSV save failed: <why>" and changes nothing else.
 * @return false when the cycle did not run (already collecting or no devices).
 */
bool runCollectionCycle(const ResourceCollector& collector,
                        const std::vector<config::Device>& devices, CollectionState& state,
                        RecordSink* sink = nullptr);

} // namespace collector

} // namespace proxwatch

#endif // PROXWATCH_COLLECTOR_COLLECTION_CYCLE_HPP
