#include "worker_pool.hpp"
#include "log.hpp"
#include <algorithm>
#include <exception>

namespace ghv {

namespace {

std::shared_ptr<spdlog::logger> pool_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("pool");
  }();
  return logger;
}

} // namespace

/**
 * Construct a worker pool.
 *
 * @param workers Number of worker threads requested.
 */
WorkerPool::WorkerPool(int workers) : workers_(std::max(1, workers)) {}

/**
 * Stop the worker pool on destruction.
 */
WorkerPool::~WorkerPool() { stop(); }

/**
 * Start worker threads if not already running.
 */
void WorkerPool::start() {
  if (running_)
    return;
  running_ = true;
  threads_.reserve(workers_);
  for (int i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::worker, this);
  }
  pool_log()->debug("Started {} workers", workers_);
}

/**
 * Stop worker threads and drop pending jobs.
 */
void WorkerPool::stop() {
  if (!running_)
    return;
  std::queue<ScheduledJob> abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    std::swap(abandoned, jobs_);
    stats_.queued = 0;
  }
  cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
  if (!abandoned.empty()) {
    pool_log()->warn("Dropped {} queued jobs", abandoned.size());
  }
}

std::future<void> WorkerPool::submit(std::string name,
                                     std::function<void()> job) {
  ScheduledJob scheduled{std::move(name), std::move(job),
                         std::make_shared<std::promise<void>>()};
  std::future<void> fut = scheduled.promise->get_future();
  if (!running_) {
    run(scheduled);
    return fut;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push(std::move(scheduled));
    ++stats_.queued;
  }
  cv_.notify_one();
  return fut;
}

WorkerPool::Stats WorkerPool::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

/**
 * Execute one job and fulfil its promise. Exceptions are forwarded to the
 * job's future.
 */
void WorkerPool::run(ScheduledJob &scheduled) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.running;
    stats_.peak_running = std::max(stats_.peak_running, stats_.running);
  }
  std::exception_ptr error;
  try {
    scheduled.job();
  } catch (const std::exception &e) {
    pool_log()->error("Job {} failed: {}", scheduled.name, e.what());
    error = std::current_exception();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --stats_.running;
    ++(error ? stats_.failed : stats_.completed);
  }
  if (error) {
    scheduled.promise->set_exception(error);
  } else {
    scheduled.promise->set_value();
  }
}

/**
 * Worker thread loop processing queued jobs.
 */
void WorkerPool::worker() {
  while (true) {
    ScheduledJob scheduled;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
      if (!running_)
        return;
      scheduled = std::move(jobs_.front());
      jobs_.pop();
      --stats_.queued;
    }
    run(scheduled);
  }
}

} // namespace ghv
