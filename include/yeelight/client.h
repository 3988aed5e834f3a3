#pragma once

#include "yeelight/control_session.h"
#include "yeelight/discovery.h"
#include "yeelight/events.h"
#include "yeelight/registry.h"
#include "yeelight/storage.h"
#include "yeelight/supervisor.h"
#include "yeelight/sync_coordinator.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yeelight {

/**
 * Configuration of every component owned by a Client.
 */
struct ClientConfig {
  DiscoveryConfig discovery;
  SessionConfig session;
  SyncConfig sync;
  RetryPolicy retry;
  RegistryConfig registry;
  /// Applied to every component that has no log callback of its own.
  LogCallback log_callback;
  /// Supervise Discover() and OpenSession() with the retry policy.
  bool supervise = true;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Caller-owned entry point wiring registry, discovery, sessions, event hub,
 * sync coordinator and supervisor together.
 *
 * Sessions opened through the client are owned by it, attached to the sync
 * coordinator and closed by Stop(). A session whose transport fails marks its
 * device unreachable and is detached; OpenSession() reconnects it.
 */
class Client {
 public:
  explicit Client(ClientConfig config = ClientConfig());
  /// Stop and release all sessions.
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /// Validate the configuration and start the sync coordinator.
  bool Start(Error* error = nullptr);
  /// Close every session and stop the coordinator.
  void Stop();
  bool running() const;

  /// Run a (supervised) discovery pass.
  bool Discover(std::vector<Device>* devices, Error* error = nullptr,
                const CancelToken* cancel = nullptr);

  /**
   * Open (or return the already-open) session for a registry address.
   * The device must be in the registry, e.g. from Discover(). A newly
   * opened session queries the device state once; a failed query is only
   * logged.
   *
   * @return Non-owning pointer valid until CloseSession() or Stop().
   */
  ControlSession* OpenSession(const std::string& address, Error* error = nullptr,
                              const CancelToken* cancel = nullptr);
  bool CloseSession(const std::string& address);
  ControlSession* GetSession(const std::string& address) const;
  std::vector<std::string> OpenSessions() const;

  EventHub::SubscriptionId Subscribe(EventHub::Handler handler);
  bool Unsubscribe(EventHub::SubscriptionId id);

  bool CreateGroup(SyncGroup group, std::string* id = nullptr, Error* error = nullptr);
  bool UpdateGroup(const SyncGroup& group, Error* error = nullptr);
  bool DeleteGroup(const std::string& id, Error* error = nullptr);
  std::optional<SyncGroup> GetGroup(const std::string& id) const;
  std::vector<SyncGroup> Groups() const;

  /// Persist registry and groups.
  bool SaveSnapshot(KeyValueStore& store, Error* error = nullptr) const;
  /// Restore registry and groups saved by SaveSnapshot().
  bool LoadSnapshot(KeyValueStore& store, Error* error = nullptr);

  Registry& registry();
  EventHub& events();
  SyncCoordinator& coordinator();
  Supervisor& supervisor();
  const ClientConfig& config() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace yeelight
