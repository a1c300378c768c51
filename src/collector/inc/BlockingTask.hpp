#ifndef PROXWATCH_COLLECTOR_BLOCKING_TASK_HPP
#define PROXWATCH_COLLECTOR_BLOCKING_TASK_HPP
/**
 * @file BlockingTask.hpp
 * @brief Run a blocking callable on its own worker thread and hand back a future.
 *
 * The worker is detached: a caller that stops waiting (deadline passed) simply
 * drops the future and the worker finishes on its own. Anything the callable
 * touches must therefore be owned by the callable (copies or shared_ptr).
 *
 * Workers may log. A process must call waitForWorkers() before tearing down the
 * logger, otherwise a worker stuck in DNS or recvfrom can log into a destroyed sink.
 *
 * Usage:
 * @code
 *   auto fut = spawnBlocking([getter, host, oid] { return getter->get(host, oid); });
 *   if (fut.wait_until(deadline) == std::future_status::ready) {
 *     const auto RES = fut.get();
 *   }
 * @endcode
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

namespace proxwatch {

namespace collector {

namespace detail {

/// Count of running workers, shared by every spawnBlocking() instantiation.
inline std::atomic<std::size_t>& workerCount() noexcept {
  static std::atomic<std::size_t> count{0};
  return count;
}

} // namespace detail

/**
 * @brief Start fn() on a new detached thread.
 * @return Future for fn's result; exceptions thrown by fn arrive through get().
 * @throws std::system_error if the thread cannot be created.
 */
template <typename Fn>
[[nodiscard]] auto spawnBlocking(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
  using Result = std::invoke_result_t<std::decay_t<Fn>>;

  auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
  std::future<Result> fut = task->get_future();

  std::atomic<std::size_t>& running = detail::workerCount();
  running.fetch_add(1);
  try {
    std::thread([task]() {
      (*task)();
      detail::workerCount().fetch_sub(1);
    }).detach();
  } catch (const std::system_error&) {
    running.fetch_sub(1);
    throw;
  }
  return fut;
}

/// @brief Workers started by spawnBlocking() that have not finished yet.
[[nodiscard]] inline std::size_t outstandingWorkers() noexcept {
  return detail::workerCount().load();
}

/**
 * @brief Wait until every spawned worker has finished.
 * @param bound Longest time to wait.
 * @return false if workers were still running when bound expired.
 */
[[nodiscard]] inline bool waitForWorkers(std::chrono::milliseconds bound) {
  constexpr auto POLL = std::chrono::milliseconds(10);
  const auto DEADLINE = std::chrono::steady_clock::now() + bound;
  while (outstandingWorkers() != 0) {
    if (std::chrono::steady_clock::now() >= DEADLINE) {
      return false;
    }
    std::this_thread::sleep_for(POLL);
  }
  return true;
}

/**
 * @brief Deadline for a task dispatched now with the given bound.
 */
[[nodiscard]] inline std::chrono::steady_clock::time_point
deadlineAfter(std::chrono::milliseconds bound) noexcept {
  return std::chrono::steady_clock::now() + bound;
}

} // namespace collector

} // namespace proxwatch

#endif // PROXWATCH_COLLECTOR_BLOCKING_TASK_HPP
