#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace yeelight {

/**
 * Cancellation flag shared between a caller and a blocking operation.
 *
 * Every suspending call in the library (discovery window, response wait,
 * backoff sleep) accepts an optional token; Cancel() wakes all waiters.
 */
class CancelToken {
 public:
  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void Cancel();
  bool IsCancelled() const;

  /// Sleep for up to `duration`. Returns true if cancelled before it elapsed.
  bool WaitFor(std::chrono::milliseconds duration) const;

  /// Sleep until `deadline`. Returns true if cancelled before it passed.
  bool WaitUntil(std::chrono::steady_clock::time_point deadline) const;

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
};

/// Null-safe helpers for optional tokens.
inline bool IsCancelled(const CancelToken* token) {
  return token != nullptr && token->IsCancelled();
}

/// Sleep for `duration`, waking early on cancellation. Returns true if cancelled.
bool SleepFor(std::chrono::milliseconds duration, const CancelToken* token);

}  // namespace yeelight
