/**
 * @file worker_pool.hpp
 * @brief Bounded thread pool running per-repository backup pipelines.
 *
 * Defines the WorkerPool class, which executes submitted jobs on a fixed
 * number of worker threads and counts queued, running and finished jobs for
 * batch progress reporting.
 */
#ifndef GHVAULT_WORKER_POOL_HPP
#define GHVAULT_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ghv {

/**
 * Thread pool executing submitted jobs across a fixed number of workers.
 * At most `workers` jobs run concurrently.
 */
class WorkerPool {
public:
  /** Job counters at one point in time. */
  struct Stats {
    std::size_t queued{0};
    std::size_t running{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t peak_running{0}; ///< Highest concurrent job count seen
  };

  /**
   * @param workers Number of worker threads (minimum one).
   */
  explicit WorkerPool(int workers);

  /// Destructor stops the worker threads.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Start the worker threads.
  void start();

  /**
   * Stop the worker threads after the running jobs finish. Jobs still
   * queued are dropped and their futures report `broken_promise`.
   */
  void stop();

  /**
   * Submit a job for execution.
   *
   * @param name Label used in logs.
   * @param job Callable to execute on one of the worker threads. When the
   *        pool is not running the job executes inline.
   * @return Future that becomes ready once the job completes; it rethrows
   *         the job's exception.
   */
  std::future<void> submit(std::string name, std::function<void()> job);

  /// Number of worker threads.
  int workers() const { return workers_; }

  /// Current job counters.
  Stats stats() const;

private:
  struct ScheduledJob {
    std::string name;
    std::function<void()> job;
    std::shared_ptr<std::promise<void>> promise;
  };

  void worker();
  void run(ScheduledJob &scheduled);

  int workers_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> threads_;
  std::queue<ScheduledJob> jobs_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  Stats stats_;
};

} // namespace ghv

#endif // GHVAULT_WORKER_POOL_HPP
