#pragma once

#include "yeelight/cancel.h"
#include "yeelight/command.h"
#include "yeelight/device.h"
#include "yeelight/error.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace yeelight {

class ControlSession;
class EventHub;
class Registry;

#ifdef YEELIGHT_TESTING
namespace test {
void InjectLine(ControlSession& session, const std::string& line);
uint32_t PeekNextRequestId(ControlSession& session);
size_t GetPendingCount(ControlSession& session);
}  // namespace test
#endif

/**
 * Connection lifecycle of a control session.
 *
 * Disconnected -> Connecting -> Ready -> Disconnected (transport error), or
 * Ready -> Closing -> Disconnected (explicit Close). Ready is only reached
 * through a fresh Connecting attempt.
 */
enum class SessionState : uint8_t {
  kDisconnected,
  kConnecting,
  kReady,
  kClosing,
};

const char* SessionStateName(SessionState state);

/**
 * Counters for command flow and error reporting.
 */
struct SessionMetrics {
  uint64_t commands_sent = 0;
  uint64_t responses_received = 0;
  uint64_t notifications_received = 0;
  uint64_t parse_errors = 0;
  uint64_t unknown_responses = 0;
  uint64_t timeouts = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Session timing and transport configuration.
 */
struct SessionConfig {
  /// TCP connect timeout.
  std::chrono::milliseconds connect_timeout{3000};
  /// How long Send() waits for the correlated response.
  std::chrono::milliseconds response_timeout{5000};
  /// Idle time before a get_prop keep-alive is sent (0 disables).
  std::chrono::milliseconds keepalive_interval{30000};
  /// Longest accepted inbound line; longer frames drop the connection.
  size_t max_line_length = 16 * 1024;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Anything commands can be sent through. The sync coordinator only holds
 * non-owning CommandChannel pointers.
 */
class CommandChannel {
 public:
  virtual ~CommandChannel() = default;

  /// Device address ("ip:port").
  virtual std::string address() const = 0;
  virtual SessionState state() const = 0;
  /// Send and wait for the correlated response.
  virtual CommandResult Send(const Command& command,
                             const CancelToken* cancel = nullptr) = 0;
};

/**
 * Persistent TCP connection to one device speaking the JSON line protocol.
 *
 * A reader thread decodes responses and "props" pushes. Pushes are merged
 * into the registry entry of the device and published on the event hub from
 * the reader thread. The session never reconnects by itself.
 */
class ControlSession : public CommandChannel {
 public:
  using DisconnectCallback =
      std::function<void(const std::string& address, const Error& error)>;

  /// Registry and event hub are optional and must outlive the session.
  ControlSession(Device device, SessionConfig config,
                 Registry* registry = nullptr, EventHub* events = nullptr);
  /// Close the connection and join the reader thread.
  ~ControlSession() override;

  ControlSession(const ControlSession&) = delete;
  ControlSession& operator=(const ControlSession&) = delete;

  /// Connect and start the reader thread. Only valid while Disconnected.
  bool Open(Error* error = nullptr);
  /// Close the connection; pending requests fail with kConnectionLost.
  void Close();

  std::string address() const override;
  SessionState state() const override;
  CommandResult Send(const Command& command,
                     const CancelToken* cancel = nullptr) override;

  CommandResult SetPower(bool on, const Transition& transition = Transition::Sudden());
  CommandResult Toggle();
  CommandResult SetBrightness(int brightness, const Transition& transition = Transition());
  CommandResult SetRgb(int red, int green, int blue,
                       const Transition& transition = Transition());
  CommandResult SetHsv(int hue, int saturation, const Transition& transition = Transition());
  CommandResult SetColorTemperature(int kelvin, const Transition& transition = Transition());
  CommandResult StartFlow(const Flow& flow);
  /// Succeeds when no flow is running.
  CommandResult StopFlow();
  CommandResult SetScene(const Scene& scene);
  CommandResult SetName(const std::string& name);
  CommandResult SetDefault();
  CommandResult SetMusic(bool enabled, const std::string& host = {}, uint16_t port = 0);
  CommandResult SetAdjust(AdjustAction action, AdjustProperty property);
  CommandResult GetProperties(const std::vector<std::string>& names);

  /// Query power/brightness/color and publish the result like a push.
  bool RefreshState(Error* error = nullptr);

  /// Invoked once per connection when the transport fails, on the thread that
  /// observed the failure (normally the reader thread). Not invoked by Close().
  void SetDisconnectCallback(DisconnectCallback cb);

  /// Device metadata and last state known to this session.
  Device device() const;
  std::chrono::steady_clock::time_point last_activity() const;
  SessionMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef YEELIGHT_TESTING
  friend void test::InjectLine(ControlSession& session, const std::string& line);
  friend uint32_t test::PeekNextRequestId(ControlSession& session);
  friend size_t test::GetPendingCount(ControlSession& session);
#endif
};

}  // namespace yeelight
