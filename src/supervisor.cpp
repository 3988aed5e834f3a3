#include "yeelight/supervisor.h"

#include "yeelight/control_session.h"
#include "yeelight/discovery.h"

#include "logging.h"

#include <algorithm>
#include <cmath>

namespace yeelight {

bool RetryPolicy::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (base_delay.count() < 0) {
    return fail("base_delay must not be negative");
  }
  if (!(multiplier >= 1.0)) {
    return fail("multiplier must be at least 1.0");
  }
  if (max_delay < base_delay) {
    return fail("max_delay must not be less than base_delay");
  }
  if (max_attempts < 1) {
    return fail("max_attempts must be at least 1");
  }
  return true;
}

std::chrono::milliseconds RetryPolicy::DelayForAttempt(int retry) const {
  if (retry < 1) {
    retry = 1;
  }
  const double delay =
      static_cast<double>(base_delay.count()) * std::pow(multiplier, retry - 1);
  if (!std::isfinite(delay) || delay >= static_cast<double>(max_delay.count())) {
    return max_delay;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

Supervisor::Supervisor(RetryPolicy policy, LogCallback log_callback)
    : policy_(policy), log_callback_(std::move(log_callback)) {}

bool Supervisor::IsRetryable(ErrorCode code) {
  switch (code) {
    case ErrorCode::kCancelled:
    case ErrorCode::kInvalidConfig:
    case ErrorCode::kInvalidState:
    case ErrorCode::kInvalidArgument:
      return false;
    default:
      return true;
  }
}

bool Supervisor::Run(const std::string& name, const Operation& operation,
                     Error* error, const CancelToken* cancel) {
  runs_.fetch_add(1);
  std::string reason;
  if (!policy_.Validate(&reason)) {
    failures_.fetch_add(1);
    return SetError(error, ErrorCode::kInvalidConfig, reason);
  }

  Error last;
  for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    if (IsCancelled(cancel)) {
      last = Error{ErrorCode::kCancelled, name + " cancelled"};
      break;
    }
    attempts_.fetch_add(1);
    Error attempt_error;
    if (operation(&attempt_error)) {
      successes_.fetch_add(1);
      return true;
    }
    if (attempt_error.ok()) {
      attempt_error = Error{ErrorCode::kInvalidState, name + " failed without an error"};
    }
    last = attempt_error;
    if (!IsRetryable(last.code) || attempt == policy_.max_attempts) {
      break;
    }
    const auto delay = policy_.DelayForAttempt(attempt);
    internal::LogMessage(log_callback_,
                         name + " failed (" + last.ToString() + "), retrying in " +
                             std::to_string(delay.count()) + " ms (attempt " +
                             std::to_string(attempt + 1) + " of " +
                             std::to_string(policy_.max_attempts) + ")");
    if (SleepFor(delay, cancel)) {
      last = Error{ErrorCode::kCancelled, name + " cancelled"};
      break;
    }
  }

  if (last.code == ErrorCode::kCancelled) {
    cancellations_.fetch_add(1);
    return SetError(error, last.code, last.message);
  }
  failures_.fetch_add(1);
  ReportFailure(name, last);
  return SetError(error, last.code, last.message);
}

bool Supervisor::Discover(Discovery& discovery, std::vector<Device>* devices,
                          Error* error, const CancelToken* cancel) {
  return Run(
      "discovery",
      [&](Error* attempt_error) { return discovery.Discover(devices, attempt_error, cancel); },
      error, cancel);
}

bool Supervisor::OpenSession(ControlSession& session, Error* error,
                             const CancelToken* cancel) {
  return Run(
      "session " + session.address(),
      [&](Error* attempt_error) { return session.Open(attempt_error); }, error, cancel);
}

void Supervisor::SetFailureCallback(FailureCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  failure_cb_ = std::move(cb);
}

SupervisorMetrics Supervisor::GetMetrics() const {
  SupervisorMetrics metrics;
  metrics.runs = runs_.load();
  metrics.attempts = attempts_.load();
  metrics.successes = successes_.load();
  metrics.failures = failures_.load();
  metrics.cancellations = cancellations_.load();
  metrics.callback_exceptions = callback_exceptions_.load();
  return metrics;
}

void Supervisor::ReportFailure(const std::string& name, const Error& error) {
  internal::LogMessage(log_callback_, name + " gave up: " + error.ToString());
  FailureCallback cb_copy;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb_copy = failure_cb_;
  }
  if (!cb_copy) {
    return;
  }
  try {
    cb_copy(name, error);
  } catch (...) {
    callback_exceptions_.fetch_add(1);
    internal::LogCallbackError(log_callback_, "SupervisorFailureCallback");
  }
}

}  // namespace yeelight
