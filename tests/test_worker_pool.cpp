#include "worker_pool.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

using namespace ghv;

TEST_CASE("worker pool bounds concurrency") {
  WorkerPool pool(2);
  pool.start();
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 6; ++i) {
    futures.push_back(pool.submit("repo-" + std::to_string(i), [&] {
      int now = ++running;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      --running;
    }));
  }
  for (auto &f : futures) {
    f.get();
  }
  REQUIRE(peak.load() <= 2);
  auto stats = pool.stats();
  REQUIRE(stats.peak_running >= 1);
  REQUIRE(stats.peak_running <= 2);
  REQUIRE(stats.completed == 6);
  REQUIRE(stats.failed == 0);
  REQUIRE(stats.queued == 0);
  REQUIRE(stats.running == 0);
  pool.stop();
}

TEST_CASE("worker pool forwards job failures") {
  WorkerPool pool(1);
  pool.start();
  auto fut = pool.submit("broken", [] { throw std::runtime_error("boom"); });
  REQUIRE_THROWS_AS(fut.get(), std::runtime_error);
  auto stats = pool.stats();
  REQUIRE(stats.failed == 1);
  REQUIRE(stats.completed == 0);
  pool.stop();
}

TEST_CASE("worker pool runs inline when stopped") {
  WorkerPool pool(0);
  REQUIRE(pool.workers() == 1);
  bool ran = false;
  auto fut = pool.submit("inline", [&] { ran = true; });
  REQUIRE(ran);
  fut.get();
  REQUIRE(pool.stats().completed == 1);
  REQUIRE(pool.stats().peak_running == 1);
}
