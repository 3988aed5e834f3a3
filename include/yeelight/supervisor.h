#pragma once

#include "yeelight/cancel.h"
#include "yeelight/device.h"
#include "yeelight/error.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace yeelight {

class ControlSession;
class Discovery;

/**
 * Bounded exponential backoff.
 */
struct RetryPolicy {
  std::chrono::milliseconds base_delay{1000};
  double multiplier = 2.0;
  std::chrono::milliseconds max_delay{30000};
  /// Total attempts including the first one.
  int max_attempts = 5;

  bool Validate(std::string* error = nullptr) const;

  /// Delay before retry number `retry` (1-based), capped at max_delay.
  std::chrono::milliseconds DelayForAttempt(int retry) const;
};

struct SupervisorMetrics {
  uint64_t runs = 0;
  uint64_t attempts = 0;
  uint64_t successes = 0;
  uint64_t failures = 0;
  uint64_t cancellations = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Retries fallible operations (discovery, session opening) with backoff.
 *
 * Errors that retrying cannot fix (cancellation, invalid configuration or
 * state, bad arguments) end the run immediately.
 */
class Supervisor {
 public:
  using Operation = std::function<bool(Error* error)>;
  using FailureCallback =
      std::function<void(const std::string& name, const Error& error)>;

  explicit Supervisor(RetryPolicy policy = RetryPolicy(),
                      LogCallback log_callback = nullptr);

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  /**
   * Run `operation` until it succeeds, attempts are exhausted, or `cancel`
   * fires. Backoff sleeps wake immediately on cancellation.
   *
   * @return true on success. Otherwise the last error (or kCancelled) is
   *         written to `error` and reported to the failure callback.
   */
  bool Run(const std::string& name, const Operation& operation,
           Error* error = nullptr, const CancelToken* cancel = nullptr);

  /// Supervised discovery pass. Partial results survive a cancellation.
  bool Discover(Discovery& discovery, std::vector<Device>* devices,
                Error* error = nullptr, const CancelToken* cancel = nullptr);

  /// Supervised ControlSession::Open().
  bool OpenSession(ControlSession& session, Error* error = nullptr,
                   const CancelToken* cancel = nullptr);

  void SetFailureCallback(FailureCallback cb);
  const RetryPolicy& policy() const { return policy_; }
  SupervisorMetrics GetMetrics() const;

  /// True for errors that end a run without further attempts.
  static bool IsRetryable(ErrorCode code);

 private:
  void ReportFailure(const std::string& name, const Error& error);

  RetryPolicy policy_;
  LogCallback log_callback_;

  std::mutex callback_mutex_;
  FailureCallback failure_cb_;

  std::atomic<uint64_t> runs_{0};
  std::atomic<uint64_t> attempts_{0};
  std::atomic<uint64_t> successes_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<uint64_t> cancellations_{0};
  std::atomic<uint64_t> callback_exceptions_{0};
};

}  // namespace yeelight
