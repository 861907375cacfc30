/**
 * @file retry.hpp
 * @brief Bounded exponential backoff for retryable backup failures.
 */

#ifndef GHVAULT_RETRY_HPP
#define GHVAULT_RETRY_HPP

#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>

namespace ghv {

/// Retry settings applied to operations failing with a retryable ErrorKind.
struct RetryPolicy {
  int max_attempts{3}; ///< Total attempts including the first one (min 1).
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{30000};

  /// Delay before retry number @p attempt (0-based): initial * 2^attempt.
  std::chrono::milliseconds backoff_for(int attempt) const {
    auto delay = initial_backoff;
    for (int i = 0; i < attempt && delay < max_backoff; ++i) {
      delay *= 2;
    }
    return std::min(delay, max_backoff);
  }
};

/**
 * Invoke @p fn, retrying while it throws a retryable BackupError.
 *
 * @param policy Attempt budget and backoff schedule.
 * @param fn Operation to run.
 * @param on_retry Optional hook invoked with the failed attempt index and the
 *        error before sleeping, e.g. to discard partial output.
 * @return Whatever @p fn returns on its first successful attempt.
 * @throws BackupError The last error once attempts are exhausted, or the
 *         first non-retryable error.
 */
template <typename F>
auto retry_call(const RetryPolicy &policy, F fn,
                const std::function<void(int, const BackupError &)> &on_retry =
                    {}) -> decltype(fn()) {
  const int attempts = std::max(1, policy.max_attempts);
  int attempt = 0;
  while (true) {
    try {
      return fn();
    } catch (const BackupError &e) {
      if (!e.retryable() || attempt + 1 >= attempts) {
        throw;
      }
      if (on_retry) {
        on_retry(attempt, e);
      }
      std::this_thread::sleep_for(policy.backoff_for(attempt));
      ++attempt;
    }
  }
}

} // namespace ghv

#endif // GHVAULT_RETRY_HPP
