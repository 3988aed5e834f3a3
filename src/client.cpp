#include "yeelight/client.h"

#include "logging.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>

namespace yeelight {
namespace {

ClientConfig WithDefaultLogging(ClientConfig config) {
  if (config.log_callback) {
    if (!config.discovery.log_callback) {
      config.discovery.log_callback = config.log_callback;
    }
    if (!config.session.log_callback) {
      config.session.log_callback = config.log_callback;
    }
    if (!config.sync.log_callback) {
      config.sync.log_callback = config.log_callback;
    }
    if (!config.registry.log_callback) {
      config.registry.log_callback = config.log_callback;
    }
  }
  return config;
}

}  // namespace

bool ClientConfig::Validate(std::string* error) const {
  auto check = [&](bool ok, const char* section, const std::string& reason) {
    if (!ok && error) {
      *error = std::string(section) + ": " + reason;
    }
    return ok;
  };
  std::string reason;
  return check(discovery.Validate(&reason), "discovery", reason) &&
         check(session.Validate(&reason), "session", reason) &&
         check(sync.Validate(&reason), "sync", reason) &&
         check(retry.Validate(&reason), "retry", reason) &&
         check(registry.Validate(&reason), "registry", reason);
}

struct Client::Impl {
  explicit Impl(ClientConfig config)
      : config_(WithDefaultLogging(std::move(config))),
        registry_(config_.registry),
        events_(config_.log_callback),
        discovery_(config_.discovery, &registry_),
        supervisor_(config_.retry, config_.log_callback),
        coordinator_(config_.sync) {}

  bool Start(Error* error) {
    std::string reason;
    if (!config_.Validate(&reason)) {
      return SetError(error, ErrorCode::kInvalidConfig, reason);
    }
    if (running_.exchange(true)) {
      return true;
    }
    if (!coordinator_.Start()) {
      running_ = false;
      return SetError(error, ErrorCode::kInvalidConfig, "sync coordinator failed to start");
    }
    subscription_ = events_.Subscribe(
        [this](const StateChangeEvent& event) { coordinator_.HandleStateChange(event); });
    return true;
  }

  void Stop() {
    if (!running_.exchange(false)) {
      return;
    }
    events_.Unsubscribe(subscription_);
    subscription_ = 0;
    // Cancels propagation in flight before the sessions go away.
    coordinator_.Stop();
    // Closed outside the lock: Close() joins reader threads that may be
    // running subscriber code which calls back into the client.
    std::map<std::string, std::shared_ptr<ControlSession>> sessions;
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      sessions.swap(sessions_);
    }
    for (auto& entry : sessions) {
      coordinator_.Detach(entry.first);
      entry.second->Close();
    }
  }

  bool Discover(std::vector<Device>* devices, Error* error, const CancelToken* cancel) {
    if (config_.supervise) {
      return supervisor_.Discover(discovery_, devices, error, cancel);
    }
    return discovery_.Discover(devices, error, cancel);
  }

  ControlSession* OpenSession(const std::string& address, Error* error,
                              const CancelToken* cancel) {
    if (!running_) {
      SetError(error, ErrorCode::kInvalidState, "client is not running");
      return nullptr;
    }
    std::shared_ptr<ControlSession> session;
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      auto it = sessions_.find(address);
      if (it != sessions_.end() && it->second->state() == SessionState::kReady) {
        return it->second.get();
      }
      bool created = false;
      if (it == sessions_.end()) {
        const std::optional<Device> device = registry_.Get(address);
        if (!device) {
          SetError(error, ErrorCode::kNotFound, "unknown device: " + address);
          return nullptr;
        }
        std::shared_ptr<ControlSession> fresh =
            std::make_shared<ControlSession>(*device, config_.session, &registry_, &events_);
        fresh->SetDisconnectCallback(
            [this](const std::string& lost, const Error& reason) {
              coordinator_.Detach(lost);
              internal::LogMessage(config_.log_callback,
                                   "Session " + lost + " detached: " + reason.ToString());
            });
        it = sessions_.emplace(address, std::move(fresh)).first;
        created = true;
      }

      session = it->second;
      const bool opened = config_.supervise ? supervisor_.OpenSession(*session, error, cancel)
                                            : session->Open(error);
      if (!opened) {
        if (created) {
          sessions_.erase(it);
        }
        return nullptr;
      }
      coordinator_.Attach(session.get());
    }

    // Start from the device's real levels rather than an unreported state.
    // Queried outside the lock since the reply is published to subscribers.
    Error refresh_error;
    if (!session->RefreshState(&refresh_error)) {
      internal::LogMessage(config_.log_callback,
                           "Session " + address + " state refresh failed: " +
                               refresh_error.ToString());
    }
    return session.get();
  }

  bool CloseSession(const std::string& address) {
    std::shared_ptr<ControlSession> session;
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      auto it = sessions_.find(address);
      if (it == sessions_.end()) {
        return false;
      }
      session = std::move(it->second);
      sessions_.erase(it);
    }
    coordinator_.Detach(address);
    session->Close();
    return true;
  }

  ControlSession* GetSession(const std::string& address) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(address);
    return it == sessions_.end() ? nullptr : it->second.get();
  }

  std::vector<std::string> OpenSessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::string> addresses;
    for (const auto& entry : sessions_) {
      if (entry.second->state() == SessionState::kReady) {
        addresses.push_back(entry.first);
      }
    }
    return addresses;
  }

  bool SaveSnapshot(KeyValueStore& store, Error* error) const {
    return SaveRegistrySnapshot(registry_, store, error) &&
           SaveSyncGroups(coordinator_.Groups(), store, error);
  }

  bool LoadSnapshot(KeyValueStore& store, Error* error) {
    Error load_error;
    const size_t devices = LoadRegistrySnapshot(store, &registry_, &load_error);
    if (!load_error.ok()) {
      return SetError(error, load_error.code, load_error.message);
    }
    std::vector<SyncGroup> groups;
    if (!LoadSyncGroups(store, &groups, error)) {
      return false;
    }
    const size_t loaded = coordinator_.LoadGroups(groups);
    internal::LogMessage(config_.log_callback,
                         "Restored " + std::to_string(devices) + " device(s) and " +
                             std::to_string(loaded) + " sync group(s)");
    return true;
  }

  ClientConfig config_;
  Registry registry_;
  EventHub events_;
  Discovery discovery_;
  Supervisor supervisor_;
  SyncCoordinator coordinator_;

  std::atomic<bool> running_{false};
  EventHub::SubscriptionId subscription_ = 0;

  mutable std::mutex sessions_mutex_;
  // Declared last so sessions are destroyed before what they reference.
  std::map<std::string, std::shared_ptr<ControlSession>> sessions_;
};

Client::Client(ClientConfig config) : impl_(new Impl(std::move(config))) {}

Client::~Client() { Stop(); }

bool Client::Start(Error* error) { return impl_->Start(error); }

void Client::Stop() { impl_->Stop(); }

bool Client::running() const { return impl_->running_.load(); }

bool Client::Discover(std::vector<Device>* devices, Error* error, const CancelToken* cancel) {
  return impl_->Discover(devices, error, cancel);
}

ControlSession* Client::OpenSession(const std::string& address, Error* error,
                                    const CancelToken* cancel) {
  return impl_->OpenSession(address, error, cancel);
}

bool Client::CloseSession(const std::string& address) {
  return impl_->CloseSession(address);
}

ControlSession* Client::GetSession(const std::string& address) const {
  return impl_->GetSession(address);
}

std::vector<std::string> Client::OpenSessions() const { return impl_->OpenSessions(); }

EventHub::SubscriptionId Client::Subscribe(EventHub::Handler handler) {
  return impl_->events_.Subscribe(std::move(handler));
}

bool Client::Unsubscribe(EventHub::SubscriptionId id) {
  return impl_->events_.Unsubscribe(id);
}

bool Client::CreateGroup(SyncGroup group, std::string* id, Error* error) {
  return impl_->coordinator_.CreateGroup(std::move(group), id, error);
}

bool Client::UpdateGroup(const SyncGroup& group, Error* error) {
  return impl_->coordinator_.UpdateGroup(group, error);
}

bool Client::DeleteGroup(const std::string& id, Error* error) {
  return impl_->coordinator_.DeleteGroup(id, error);
}

std::optional<SyncGroup> Client::GetGroup(const std::string& id) const {
  return impl_->coordinator_.GetGroup(id);
}

std::vector<SyncGroup> Client::Groups() const { return impl_->coordinator_.Groups(); }

bool Client::SaveSnapshot(KeyValueStore& store, Error* error) const {
  return impl_->SaveSnapshot(store, error);
}

bool Client::LoadSnapshot(KeyValueStore& store, Error* error) {
  return impl_->LoadSnapshot(store, error);
}

Registry& Client::registry() { return impl_->registry_; }

EventHub& Client::events() { return impl_->events_; }

SyncCoordinator& Client::coordinator() { return impl_->coordinator_; }

Supervisor& Client::supervisor() { return impl_->supervisor_; }

const ClientConfig& Client::config() const { return impl_->config_; }

}  // namespace yeelight
