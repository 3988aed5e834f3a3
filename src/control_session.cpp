#include "yeelight/control_session.h"

#include "yeelight/events.h"
#include "yeelight/registry.h"

#include "logging.h"
#include "net.h"
#include "protocol.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace yeelight {
namespace {

constexpr std::chrono::milliseconds kReadPollInterval{200};
constexpr size_t kReadChunkSize = 4096;

struct PendingRequest {
  bool done = false;
  CommandResult result;
};

struct SessionMetricsAtomic {
  std::atomic<uint64_t> commands_sent{0};
  std::atomic<uint64_t> responses_received{0};
  std::atomic<uint64_t> notifications_received{0};
  std::atomic<uint64_t> parse_errors{0};
  std::atomic<uint64_t> unknown_responses{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> callback_exceptions{0};

  SessionMetrics Snapshot() const {
    SessionMetrics snapshot;
    snapshot.commands_sent = commands_sent.load();
    snapshot.responses_received = responses_received.load();
    snapshot.notifications_received = notifications_received.load();
    snapshot.parse_errors = parse_errors.load();
    snapshot.unknown_responses = unknown_responses.load();
    snapshot.timeouts = timeouts.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

CommandResult Failure(ErrorCode code, const std::string& message) {
  CommandResult result;
  result.error.code = code;
  result.error.message = message;
  return result;
}

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kDisconnected:
      return "disconnected";
    case SessionState::kConnecting:
      return "connecting";
    case SessionState::kReady:
      return "ready";
    case SessionState::kClosing:
      return "closing";
  }
  return "unknown";
}

bool SessionConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (connect_timeout.count() <= 0) {
    return fail("connect_timeout must be positive");
  }
  if (response_timeout.count() <= 0) {
    return fail("response_timeout must be positive");
  }
  if (keepalive_interval.count() < 0) {
    return fail("keepalive_interval must not be negative");
  }
  if (max_line_length < 256) {
    return fail("max_line_length must be at least 256 bytes");
  }
  return true;
}

struct ControlSession::Impl {
  Impl(Device device, SessionConfig config, Registry* registry, EventHub* events)
      : device_(std::move(device)),
        address_(device_.address()),
        config_(std::move(config)),
        registry_(registry),
        events_(events) {
    Touch();
  }

  ~Impl() { Close(); }

  bool Open(Error* error) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::string config_error;
    if (!config_.Validate(&config_error)) {
      internal::LogMessage(config_.log_callback, config_error);
      return SetError(error, ErrorCode::kInvalidConfig, config_error);
    }
    if (reader_thread_.joinable() &&
        reader_thread_.get_id() == std::this_thread::get_id()) {
      return SetError(error, ErrorCode::kInvalidState,
                      "cannot reopen a session from its own reader thread");
    }
    SessionState expected = SessionState::kDisconnected;
    if (!state_.compare_exchange_strong(expected, SessionState::kConnecting)) {
      return SetError(error, ErrorCode::kInvalidState,
                      std::string("session is ") + SessionStateName(expected));
    }
    JoinThreads();

    Error connect_error;
    bool connected = false;
    {
      std::lock_guard<std::mutex> write_lock(write_mutex_);
      connected = connection_.Connect(device_ip(), device_port(),
                                      config_.connect_timeout, &connect_error);
    }
    if (!connected) {
      state_ = SessionState::kDisconnected;
      internal::LogMessage(config_.log_callback,
                           "Failed to connect to " + address_ + ": " +
                               connect_error.ToString());
      if (error) {
        *error = connect_error;
      }
      return false;
    }

    read_buffer_.clear();
    running_ = true;
    Touch();
    state_ = SessionState::kReady;
    try {
      reader_thread_ = std::thread([this]() { ReadLoop(); });
      if (config_.keepalive_interval.count() > 0) {
        keepalive_thread_ = std::thread([this]() { KeepAliveLoop(); });
      }
    } catch (const std::exception& ex) {
      const std::string message = std::string("thread start failed: ") + ex.what();
      internal::LogMessage(config_.log_callback, message);
      CloseLocked();
      return SetError(error, ErrorCode::kSocketError, message);
    }
    MarkReachable();
    return true;
  }

  void Close() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    CloseLocked();
  }

  void CloseLocked() {
    if (state_ == SessionState::kReady) {
      state_ = SessionState::kClosing;
    }
    running_ = false;
    keepalive_cv_.notify_all();
    connection_.Shutdown();
    if (reader_thread_.joinable() &&
        reader_thread_.get_id() != std::this_thread::get_id()) {
      reader_thread_.join();
    }
    FailAllPending({ErrorCode::kConnectionLost, "session closed"});
    if (keepalive_thread_.joinable() &&
        keepalive_thread_.get_id() != std::this_thread::get_id()) {
      keepalive_thread_.join();
    }
    {
      std::lock_guard<std::mutex> write_lock(write_mutex_);
      connection_.Close();
    }
    state_ = SessionState::kDisconnected;
  }

  CommandResult Send(const Command& command, const CancelToken* cancel) {
    if (command.method.empty()) {
      return Failure(ErrorCode::kInvalidArgument, "command has no method");
    }
    const SessionState current = state_.load();
    if (current != SessionState::kReady) {
      return Failure(ErrorCode::kNotConnected,
                     address_ + " session is " + SessionStateName(current));
    }
    if (IsCancelled(cancel)) {
      return Failure(ErrorCode::kCancelled, "command cancelled");
    }

    auto pending = std::make_shared<PendingRequest>();
    uint32_t id = 0;
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      id = next_id_++;
      if (next_id_ == 0) {
        next_id_ = 1;
      }
      pending_[id] = pending;
    }

    const std::string line = internal::EncodeRequest(id, command);
    Error send_error;
    bool sent = false;
    {
      std::lock_guard<std::mutex> write_lock(write_mutex_);
      sent = connection_.SendAll(line, &send_error);
    }
    if (!sent) {
      RemovePending(id);
      HandleTransportFailure(send_error.message);
      return Failure(ErrorCode::kConnectionLost, send_error.message);
    }
    metrics_.commands_sent.fetch_add(1);
    Touch();

    const auto deadline = std::chrono::steady_clock::now() + config_.response_timeout;
    std::unique_lock<std::mutex> lock(pending_mutex_);
    while (!pending->done) {
      if (IsCancelled(cancel)) {
        pending_.erase(id);
        return Failure(ErrorCode::kCancelled, "command cancelled");
      }
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        pending_.erase(id);
        lock.unlock();
        metrics_.timeouts.fetch_add(1);
        internal::LogMessage(config_.log_callback,
                             "Timed out waiting for " + command.method + " (id " +
                                 std::to_string(id) + ") from " + address_);
        return Failure(ErrorCode::kTimeout, command.method + " timed out");
      }
      pending_cv_.wait_until(lock, std::min(deadline, now + internal::kWaitSlice));
    }
    return pending->result;
  }

  bool RefreshState(Error* error) {
    const auto& names = internal::StateProperties();
    CommandResult result = Send(BuildGetProperties(names), nullptr);
    if (!result.ok()) {
      if (error) {
        *error = result.error;
      }
      return false;
    }
    HandleProperties(internal::PropertiesFromResult(names, result.result));
    return true;
  }

  void SetDisconnectCallback(DisconnectCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    disconnect_cb_ = std::move(cb);
  }

  Device device() const {
    std::lock_guard<std::mutex> lock(device_mutex_);
    return device_;
  }

  std::chrono::steady_clock::time_point last_activity() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(last_activity_.load()));
  }

  // Decode and dispatch one inbound line.
  void HandleLine(const std::string& line) {
    if (line.empty() || line == "\r") {
      return;
    }
    internal::Frame frame;
    Error error;
    if (!internal::DecodeFrame(line, &frame, &error)) {
      metrics_.parse_errors.fetch_add(1);
      internal::LogMessage(config_.log_callback,
                           "Dropping frame from " + address_ + ": " + error.ToString());
      return;
    }
    if (frame.kind == internal::Frame::Kind::kNotification) {
      metrics_.notifications_received.fetch_add(1);
      if (frame.method == kMethodProps) {
        HandleProperties(frame.properties);
      }
      return;
    }

    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      auto it = pending_.find(frame.id);
      if (it == pending_.end()) {
        metrics_.unknown_responses.fetch_add(1);
        internal::LogMessage(config_.log_callback,
                             "Dropping response with unknown id " +
                                 std::to_string(frame.id) + " from " + address_);
        return;
      }
      PendingRequest& pending = *it->second;
      if (frame.kind == internal::Frame::Kind::kError) {
        pending.result.error.code = ErrorCode::kDeviceError;
        pending.result.error.message = "device error " +
                                       std::to_string(frame.error_code) + ": " +
                                       frame.error_message;
      } else {
        pending.result.result = frame.result;
      }
      pending.done = true;
      pending_.erase(it);
    }
    metrics_.responses_received.fetch_add(1);
    pending_cv_.notify_all();
  }

  void ReadLoop() {
    char buffer[kReadChunkSize];
    while (running_) {
      const auto wait =
          internal::WaitReadable(connection_.fd(), kReadPollInterval, nullptr);
      if (wait == internal::WaitResult::kTimeout) {
        continue;
      }
      if (wait != internal::WaitResult::kReady) {
        HandleTransportFailure(internal::ErrnoMessage("select()"));
        return;
      }
      const ssize_t n = connection_.Recv(buffer, sizeof(buffer));
      if (n == 0) {
        HandleTransportFailure("connection closed by device");
        return;
      }
      if (n < 0) {
        HandleTransportFailure(internal::ErrnoMessage("recv()"));
        return;
      }
      Touch();
      read_buffer_.append(buffer, static_cast<size_t>(n));
      size_t newline = read_buffer_.find('\n');
      while (newline != std::string::npos) {
        const std::string line = read_buffer_.substr(0, newline);
        read_buffer_.erase(0, newline + 1);
        HandleLine(line);
        newline = read_buffer_.find('\n');
      }
      if (read_buffer_.size() > config_.max_line_length) {
        metrics_.parse_errors.fetch_add(1);
        HandleTransportFailure("inbound line exceeds " +
                               std::to_string(config_.max_line_length) + " bytes");
        return;
      }
    }
  }

  void KeepAliveLoop() {
    std::unique_lock<std::mutex> lock(keepalive_mutex_);
    while (running_) {
      const auto idle = std::chrono::steady_clock::now() - last_activity();
      if (idle < config_.keepalive_interval) {
        keepalive_cv_.wait_for(lock, config_.keepalive_interval - idle,
                               [this]() { return !running_; });
        continue;
      }
      lock.unlock();
      const CommandResult result = Send(BuildGetProperties({"power"}), nullptr);
      if (result.error.code == ErrorCode::kTimeout) {
        internal::LogMessage(config_.log_callback,
                             "Keep-alive to " + address_ + " timed out");
        Touch();
      }
      lock.lock();
    }
  }

  // Merge a property report and publish the resulting state change.
  void HandleProperties(const std::map<std::string, std::string>& properties) {
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    std::optional<Device> stored;
    if (registry_) {
      stored = registry_->Get(address_);
    }
    const auto now = Device::Clock::now();
    LightState previous;
    LightState current;
    Device updated;
    {
      std::lock_guard<std::mutex> lock(device_mutex_);
      if (stored) {
        device_.state = stored->state;
      }
      previous = device_.state;
      current = internal::ApplyProperties(previous, properties);
      device_.state = current;
      auto name = properties.find("name");
      if (name != properties.end() && !name->second.empty()) {
        device_.name = name->second;
      }
      device_.last_seen = now;
      device_.connectivity = Connectivity::kReachable;
      updated = device_;
    }
    if (registry_) {
      registry_->Upsert(updated);
    }
    if (events_) {
      StateChangeEvent event;
      event.address = address_;
      event.previous = previous;
      event.current = current;
      event.properties = properties;
      event.observed_at = now;
      events_->Publish(event);
    }
  }

  void HandleTransportFailure(const std::string& message) {
    if (!running_.exchange(false)) {
      return;
    }
    state_ = SessionState::kDisconnected;
    keepalive_cv_.notify_all();
    connection_.Shutdown();
    const Error error{ErrorCode::kConnectionLost, message};
    internal::LogMessage(config_.log_callback,
                         "Connection to " + address_ + " lost: " + message);
    FailAllPending(error);
    if (registry_) {
      registry_->MarkUnreachable(address_, Device::Clock::now());
    }
    {
      std::lock_guard<std::mutex> lock(device_mutex_);
      device_.connectivity = Connectivity::kUnreachable;
    }
    DisconnectCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = disconnect_cb_;
    }
    if (cb_copy) {
      try {
        cb_copy(address_, error);
      } catch (...) {
        RecordCallbackException("DisconnectCallback");
      }
    }
  }

  void FailAllPending(const Error& error) {
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      for (auto& entry : pending_) {
        entry.second->result.error = error;
        entry.second->done = true;
      }
      pending_.clear();
    }
    pending_cv_.notify_all();
  }

  void RemovePending(uint32_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(id);
  }

  void MarkReachable() {
    Device updated;
    {
      std::lock_guard<std::mutex> lock(device_mutex_);
      device_.connectivity = Connectivity::kReachable;
      device_.last_seen = Device::Clock::now();
      updated = device_;
    }
    if (!registry_) {
      return;
    }
    if (auto stored = registry_->Get(address_)) {
      updated.state = stored->state;
    }
    registry_->Upsert(updated);
  }

  void JoinThreads() {
    if (reader_thread_.joinable()) {
      reader_thread_.join();
    }
    if (keepalive_thread_.joinable()) {
      keepalive_thread_.join();
    }
  }

  void RecordCallbackException(const char* name) {
    metrics_.callback_exceptions.fetch_add(1);
    internal::LogCallbackError(config_.log_callback, name);
  }

  void Touch() {
    last_activity_ = std::chrono::steady_clock::now().time_since_epoch().count();
  }

  std::string device_ip() const {
    std::lock_guard<std::mutex> lock(device_mutex_);
    return device_.ip;
  }

  uint16_t device_port() const {
    std::lock_guard<std::mutex> lock(device_mutex_);
    return device_.port;
  }

  mutable std::mutex device_mutex_;
  Device device_;
  const std::string address_;
  SessionConfig config_;
  Registry* registry_ = nullptr;
  EventHub* events_ = nullptr;

  std::mutex lifecycle_mutex_;
  std::mutex write_mutex_;
  internal::TcpConnection connection_;
  std::atomic<SessionState> state_{SessionState::kDisconnected};
  std::atomic<bool> running_{false};
  std::atomic<std::chrono::steady_clock::rep> last_activity_{0};

  std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  std::unordered_map<uint32_t, std::shared_ptr<PendingRequest>> pending_;
  uint32_t next_id_ = 1;

  std::mutex publish_mutex_;
  std::string read_buffer_;
  std::thread reader_thread_;

  std::mutex keepalive_mutex_;
  std::condition_variable keepalive_cv_;
  std::thread keepalive_thread_;

  std::mutex callback_mutex_;
  DisconnectCallback disconnect_cb_;

  SessionMetricsAtomic metrics_;
};

ControlSession::ControlSession(Device device, SessionConfig config,
                               Registry* registry, EventHub* events)
    : impl_(new Impl(std::move(device), std::move(config), registry, events)) {}

ControlSession::~ControlSession() = default;

bool ControlSession::Open(Error* error) { return impl_->Open(error); }

void ControlSession::Close() { impl_->Close(); }

std::string ControlSession::address() const { return impl_->address_; }

SessionState ControlSession::state() const { return impl_->state_.load(); }

CommandResult ControlSession::Send(const Command& command, const CancelToken* cancel) {
  return impl_->Send(command, cancel);
}

CommandResult ControlSession::SetPower(bool on, const Transition& transition) {
  return Send(BuildSetPower(on, transition));
}

CommandResult ControlSession::Toggle() { return Send(BuildToggle()); }

CommandResult ControlSession::SetBrightness(int brightness, const Transition& transition) {
  return Send(BuildSetBrightness(brightness, transition));
}

CommandResult ControlSession::SetRgb(int red, int green, int blue,
                                     const Transition& transition) {
  return Send(BuildSetRgb(red, green, blue, transition));
}

CommandResult ControlSession::SetHsv(int hue, int saturation, const Transition& transition) {
  return Send(BuildSetHsv(hue, saturation, transition));
}

CommandResult ControlSession::SetColorTemperature(int kelvin, const Transition& transition) {
  return Send(BuildSetColorTemperature(kelvin, transition));
}

CommandResult ControlSession::StartFlow(const Flow& flow) {
  const Command command = BuildStartFlow(flow);
  if (command.method.empty()) {
    return Failure(ErrorCode::kInvalidArgument, "flow has no transitions");
  }
  return Send(command);
}

CommandResult ControlSession::StopFlow() {
  CommandResult result = Send(BuildStopFlow());
  // Some firmware answers stop_cf with an error when no flow is running.
  if (result.error.code == ErrorCode::kDeviceError) {
    internal::LogMessage(impl_->config_.log_callback,
                         "stop_cf on " + address() + " reported " +
                             result.error.message + "; treating as no-op");
    result = CommandResult();
    result.result.append("ok");
  }
  return result;
}

CommandResult ControlSession::SetScene(const Scene& scene) {
  const Command command = BuildSetScene(scene);
  if (command.method.empty()) {
    return Failure(ErrorCode::kInvalidArgument, "flow scene has no transitions");
  }
  return Send(command);
}

CommandResult ControlSession::SetName(const std::string& name) {
  return Send(BuildSetName(name));
}

CommandResult ControlSession::SetDefault() { return Send(BuildSetDefault()); }

CommandResult ControlSession::SetMusic(bool enabled, const std::string& host, uint16_t port) {
  if (enabled && (host.empty() || port == 0)) {
    return Failure(ErrorCode::kInvalidArgument, "music mode needs a host and port");
  }
  return Send(BuildSetMusic(enabled, host, port));
}

CommandResult ControlSession::SetAdjust(AdjustAction action, AdjustProperty property) {
  return Send(BuildSetAdjust(action, property));
}

CommandResult ControlSession::GetProperties(const std::vector<std::string>& names) {
  if (names.empty()) {
    return Failure(ErrorCode::kInvalidArgument, "no properties requested");
  }
  return Send(BuildGetProperties(names));
}

bool ControlSession::RefreshState(Error* error) { return impl_->RefreshState(error); }

void ControlSession::SetDisconnectCallback(DisconnectCallback cb) {
  impl_->SetDisconnectCallback(std::move(cb));
}

Device ControlSession::device() const { return impl_->device(); }

std::chrono::steady_clock::time_point ControlSession::last_activity() const {
  return impl_->last_activity();
}

SessionMetrics ControlSession::GetMetrics() const { return impl_->metrics_.Snapshot(); }

#ifdef YEELIGHT_TESTING
namespace test {

void InjectLine(ControlSession& session, const std::string& line) {
  session.impl_->HandleLine(line);
}

uint32_t PeekNextRequestId(ControlSession& session) {
  std::lock_guard<std::mutex> lock(session.impl_->pending_mutex_);
  return session.impl_->next_id_;
}

size_t GetPendingCount(ControlSession& session) {
  std::lock_guard<std::mutex> lock(session.impl_->pending_mutex_);
  return session.impl_->pending_.size();
}

}  // namespace test
#endif

}  // namespace yeelight
