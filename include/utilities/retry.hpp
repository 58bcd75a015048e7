#ifndef QUICKSHARE_RETRY_HPP
#define QUICKSHARE_RETRY_HPP

#include "utilities/logger.h"
#include "utilities/relay_error.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace quickshare {

/**
 * @brief Bound and pacing of a retried operation.
 *
 * maxAttempts counts every call including the first one. The delay before
 * attempt n+1 is interval * backoffMultiplier^(n-1).
 */
struct RetryPolicy {
  int maxAttempts{3};
  std::chrono::milliseconds interval{200};
  double backoffMultiplier{1.0};
  /// Replaces std::this_thread::sleep_for when set (tests).
  std::function<void(std::chrono::milliseconds)> sleeper;

  void pause(std::chrono::milliseconds delay) const {
    if (sleeper) {
      sleeper(delay);
    } else {
      std::this_thread::sleep_for(delay);
    }
  }
};

using RetryPredicate = std::function<bool(const RelayError &)>;

/**
 * @brief Invoke @p fn until it succeeds, fails with a non-retryable error, or
 * the policy is exhausted.
 *
 * Non-retryable RelayErrors propagate unchanged. When the last permitted
 * attempt still fails with a retryable error, a RelayError carrying
 * @p exhaustedCode is thrown instead so the caller sees a distinct terminal
 * reason rather than the transient one.
 */
template <typename Fn>
auto retryWithPolicy(const RetryPolicy &policy, Fn &&fn,
                     const RetryPredicate &isRetryable, ErrorCode exhaustedCode,
                     const std::string &operation) -> decltype(fn()) {
  auto delay = policy.interval;
  const int attempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const RelayError &e) {
      if (!isRetryable(e)) {
        throw;
      }
      if (attempt >= attempts) {
        Logger::getInstance().log(LogLevel::WARN, "retry",
                                  operation + " gave up after " +
                                      std::to_string(attempt) +
                                      " attempts: " + e.what());
        throw RelayError(exhaustedCode, operation + " failed after " +
                                            std::to_string(attempt) +
                                            " attempts: " + e.what());
      }
      Logger::getInstance().log(LogLevel::DEBUG, "retry",
                                operation + " attempt " +
                                    std::to_string(attempt) + " failed (" +
                                    e.reason() + "), retrying in " +
                                    std::to_string(delay.count()) + "ms");
      policy.pause(delay);
      delay = std::chrono::milliseconds(static_cast<long long>(
          static_cast<double>(delay.count()) * policy.backoffMultiplier));
    }
  }
}

} // namespace quickshare

#endif // QUICKSHARE_RETRY_HPP
