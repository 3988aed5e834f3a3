#pragma once

#include "yeelight/control_session.h"
#include "yeelight/events.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yeelight {

/**
 * How a group's master state is propagated to the other members.
 */
enum class SyncPolicy : uint8_t {
  /// Copy of power plus the brightness and color the master has reported.
  kMirror,
  /// Inverted power only.
  kAlternate,
  /// Mirror, staggered member by member in member order.
  kSequence,
  /// Mirror with per-member brightness jitter.
  kRandom,
};

const char* SyncPolicyName(SyncPolicy policy);
bool ParseSyncPolicy(const std::string& name, SyncPolicy* out);

/**
 * Named set of device addresses with an optional master.
 */
struct SyncGroup {
  std::string id;
  std::string name;
  /// Member addresses in propagation order; no duplicates.
  std::vector<std::string> members;
  SyncPolicy policy = SyncPolicy::kMirror;
  /// Must be a member when set. Required by kMirror and kAlternate.
  std::optional<std::string> master;

  bool RequiresMaster() const;
  bool Contains(const std::string& address) const;
  bool Validate(std::string* error = nullptr) const;
};

struct SyncConfig {
  /// Delay between consecutive members under kSequence. The k-th member is
  /// due `k * sequence_stagger` after the event was dequeued, not after the
  /// previous member's sends: members whose due time has already passed
  /// (because earlier sends were slow) go out immediately.
  std::chrono::milliseconds sequence_stagger{150};
  /// Maximum brightness offset applied per member under kRandom.
  int random_brightness_jitter = 20;
  /// Transition used for propagated commands.
  Transition transition = Transition::Smooth(300);
  /// Number of recent failures kept for inspection.
  size_t failure_history = 64;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * A propagation that did not reach a member. Recorded, never raised.
 */
struct SyncFailure {
  std::string group_id;
  std::string member;
  std::string method;
  Error error;
};

struct SyncMetrics {
  uint64_t events_received = 0;
  uint64_t events_processed = 0;
  uint64_t propagations = 0;
  uint64_t commands_sent = 0;
  uint64_t command_failures = 0;
  uint64_t members_skipped = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Keeps group members consistent with their master's observed state.
 *
 * State-change events are queued by HandleStateChange() and consumed by one
 * worker thread in arrival order, so the publishing session never waits on
 * propagation. Commands go through attached CommandChannels, which the
 * coordinator never owns or closes.
 */
class SyncCoordinator {
 public:
  using FailureCallback = std::function<void(const SyncFailure&)>;

  explicit SyncCoordinator(SyncConfig config = SyncConfig());
  /// Stop the worker thread.
  ~SyncCoordinator();

  SyncCoordinator(const SyncCoordinator&) = delete;
  SyncCoordinator& operator=(const SyncCoordinator&) = delete;

  /// Start the worker thread.
  bool Start();
  /// Stop the worker; queued events are discarded.
  void Stop();

  /// Register a channel for its address. The channel must stay alive until
  /// Detach() returns.
  void Attach(CommandChannel* channel);
  /// Waits for an in-flight command to that address to finish.
  void Detach(const std::string& address);

  /// Queue an event for propagation. Safe to call from any thread.
  void HandleStateChange(const StateChangeEvent& event);

  /// Assigns an id when group.id is empty. Rejects invalid or duplicate groups.
  bool CreateGroup(SyncGroup group, std::string* id = nullptr, Error* error = nullptr);
  bool UpdateGroup(const SyncGroup& group, Error* error = nullptr);
  bool DeleteGroup(const std::string& id, Error* error = nullptr);
  std::optional<SyncGroup> GetGroup(const std::string& id) const;
  std::vector<SyncGroup> Groups() const;
  /// Replace all groups (e.g. from a snapshot). Invalid groups are skipped.
  size_t LoadGroups(const std::vector<SyncGroup>& groups);

  void SetFailureCallback(FailureCallback cb);
  std::vector<SyncFailure> RecentFailures() const;
  SyncMetrics GetMetrics() const;

  /// Block until every queued event has been processed.
  bool WaitIdle(std::chrono::milliseconds timeout);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace yeelight
