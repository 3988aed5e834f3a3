#include "yeelight/cancel.h"

#include <thread>

namespace yeelight {

void CancelToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancelToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancelToken::WaitFor(std::chrono::milliseconds duration) const {
  return WaitUntil(std::chrono::steady_clock::now() + duration);
}

bool CancelToken::WaitUntil(std::chrono::steady_clock::time_point deadline) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_until(lock, deadline, [this]() { return cancelled_; });
}

bool SleepFor(std::chrono::milliseconds duration, const CancelToken* token) {
  if (token) {
    return token->WaitFor(duration);
  }
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
  return false;
}

}  // namespace yeelight
