#include "yeelight/sync_coordinator.h"

#include "logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <unordered_map>

namespace yeelight {
namespace {

constexpr char kGroupIdPrefix[] = "group-";

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Numeric suffix of an id this coordinator generated, or 0.
uint64_t GeneratedIdNumber(const std::string& id) {
  const std::string prefix = kGroupIdPrefix;
  if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) {
    return 0;
  }
  const std::string digits = id.substr(prefix.size());
  if (!std::all_of(digits.begin(), digits.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return 0;
  }
  return std::strtoull(digits.c_str(), nullptr, 10);
}

}  // namespace

const char* SyncPolicyName(SyncPolicy policy) {
  switch (policy) {
    case SyncPolicy::kMirror:
      return "mirror";
    case SyncPolicy::kAlternate:
      return "alternate";
    case SyncPolicy::kSequence:
      return "sequence";
    case SyncPolicy::kRandom:
      return "random";
  }
  return "mirror";
}

bool ParseSyncPolicy(const std::string& name, SyncPolicy* out) {
  const std::string lower = Lowercase(name);
  SyncPolicy policy;
  if (lower == "mirror") {
    policy = SyncPolicy::kMirror;
  } else if (lower == "alternate") {
    policy = SyncPolicy::kAlternate;
  } else if (lower == "sequence") {
    policy = SyncPolicy::kSequence;
  } else if (lower == "random") {
    policy = SyncPolicy::kRandom;
  } else {
    return false;
  }
  if (out) {
    *out = policy;
  }
  return true;
}

bool SyncGroup::RequiresMaster() const {
  return policy == SyncPolicy::kMirror || policy == SyncPolicy::kAlternate;
}

bool SyncGroup::Contains(const std::string& address) const {
  return std::find(members.begin(), members.end(), address) != members.end();
}

bool SyncGroup::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (members.empty()) {
    return fail("members must not be empty");
  }
  std::set<std::string> unique;
  for (const auto& member : members) {
    if (!SplitAddress(member, nullptr, nullptr)) {
      return fail("member is not a valid ip:port address: " + member);
    }
    if (!unique.insert(member).second) {
      return fail("duplicate member: " + member);
    }
  }
  if (master && !Contains(*master)) {
    return fail("master must be a member: " + *master);
  }
  if (!master && RequiresMaster()) {
    return fail(std::string("policy ") + SyncPolicyName(policy) + " requires a master");
  }
  return true;
}

bool SyncConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (sequence_stagger.count() < 0) {
    return fail("sequence_stagger must not be negative");
  }
  if (random_brightness_jitter < 0 || random_brightness_jitter > kMaxBrightness) {
    return fail("random_brightness_jitter must be within [0, 100]");
  }
  if (failure_history == 0) {
    return fail("failure_history must be positive");
  }
  return true;
}

struct SyncCoordinator::Impl {
  explicit Impl(SyncConfig config) : config_(std::move(config)) {}

  ~Impl() { Stop(); }

  bool Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
      return true;
    }
    std::string error;
    if (!config_.Validate(&error)) {
      internal::LogMessage(config_.log_callback, error);
      return false;
    }
    stop_token_.reset(new CancelToken());
    running_ = true;
    try {
      worker_ = std::thread([this]() { WorkerLoop(); });
    } catch (const std::exception& ex) {
      running_ = false;
      internal::LogMessage(config_.log_callback,
                           std::string("thread start failed: ") + ex.what());
      return false;
    }
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (!running_) {
        return;
      }
      running_ = false;
      queue_.clear();
    }
    if (stop_token_) {
      stop_token_->Cancel();
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
    idle_cv_.notify_all();
  }

  void Attach(CommandChannel* channel) {
    if (channel == nullptr) {
      return;
    }
    std::lock_guard<std::recursive_mutex> lock(channels_mutex_);
    channels_[channel->address()] = channel;
  }

  void Detach(const std::string& address) {
    std::lock_guard<std::recursive_mutex> lock(channels_mutex_);
    channels_.erase(address);
  }

  void Enqueue(const StateChangeEvent& event) {
    events_received_.fetch_add(1);
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (!running_) {
        return;
      }
      queue_.push_back(event);
    }
    queue_cv_.notify_one();
  }

  bool CreateGroup(SyncGroup group, std::string* id, Error* error) {
    std::string reason;
    if (!group.Validate(&reason)) {
      return SetError(error, ErrorCode::kInvalidGroup, reason);
    }
    std::lock_guard<std::mutex> lock(groups_mutex_);
    if (group.id.empty()) {
      do {
        group.id = kGroupIdPrefix + std::to_string(next_group_id_++);
      } while (groups_.count(group.id) != 0);
    } else if (groups_.count(group.id) != 0) {
      return SetError(error, ErrorCode::kInvalidGroup, "group already exists: " + group.id);
    } else {
      next_group_id_ = std::max(next_group_id_, GeneratedIdNumber(group.id) + 1);
    }
    if (id) {
      *id = group.id;
    }
    groups_[group.id] = std::move(group);
    return true;
  }

  bool UpdateGroup(const SyncGroup& group, Error* error) {
    std::string reason;
    if (!group.Validate(&reason)) {
      return SetError(error, ErrorCode::kInvalidGroup, reason);
    }
    std::lock_guard<std::mutex> lock(groups_mutex_);
    auto it = groups_.find(group.id);
    if (it == groups_.end()) {
      return SetError(error, ErrorCode::kNotFound, "unknown group: " + group.id);
    }
    it->second = group;
    return true;
  }

  bool DeleteGroup(const std::string& id, Error* error) {
    std::lock_guard<std::mutex> lock(groups_mutex_);
    if (groups_.erase(id) == 0) {
      return SetError(error, ErrorCode::kNotFound, "unknown group: " + id);
    }
    return true;
  }

  std::optional<SyncGroup> GetGroup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(groups_mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<SyncGroup> Groups() const {
    std::lock_guard<std::mutex> lock(groups_mutex_);
    std::vector<SyncGroup> result;
    result.reserve(groups_.size());
    for (const auto& entry : groups_) {
      result.push_back(entry.second);
    }
    return result;
  }

  size_t LoadGroups(const std::vector<SyncGroup>& groups) {
    std::lock_guard<std::mutex> lock(groups_mutex_);
    groups_.clear();
    for (const auto& group : groups) {
      std::string reason;
      if (group.id.empty() || !group.Validate(&reason)) {
        internal::LogMessage(config_.log_callback,
                             "Skipping invalid sync group '" + group.id + "': " +
                                 (reason.empty() ? "missing id" : reason));
        continue;
      }
      next_group_id_ = std::max(next_group_id_, GeneratedIdNumber(group.id) + 1);
      groups_[group.id] = group;
    }
    return groups_.size();
  }

  bool WaitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this]() { return queue_.empty() && !busy_; });
  }

  void WorkerLoop() {
    while (true) {
      StateChangeEvent event;
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
        if (!running_) {
          return;
        }
        event = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
      }
      Process(event);
      {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        busy_ = false;
      }
      idle_cv_.notify_all();
    }
  }

  void Process(const StateChangeEvent& event) {
    events_processed_.fetch_add(1);
    if (!event.current.is_known()) {
      return;
    }
    std::vector<SyncGroup> targets;
    {
      std::lock_guard<std::mutex> lock(groups_mutex_);
      for (const auto& entry : groups_) {
        if (entry.second.master && *entry.second.master == event.address) {
          targets.push_back(entry.second);
        }
      }
    }
    const auto started = std::chrono::steady_clock::now();
    std::mt19937 rng(std::random_device{}());
    for (const auto& group : targets) {
      propagations_.fetch_add(1);
      Propagate(group, event.current, started, &rng);
    }
  }

  void Propagate(const SyncGroup& group, const LightState& master,
                 std::chrono::steady_clock::time_point started, std::mt19937* rng) {
    size_t position = 0;
    for (const auto& member : group.members) {
      if (group.master && member == *group.master) {
        continue;
      }
      if (group.policy == SyncPolicy::kSequence && position > 0) {
        const auto due = started + config_.sequence_stagger * static_cast<int>(position);
        if (stop_token_->WaitUntil(due)) {
          return;
        }
      }
      ++position;
      SendToMember(group, member, CommandsFor(group.policy, master, rng));
    }
  }

  std::vector<Command> CommandsFor(SyncPolicy policy, const LightState& master,
                                   std::mt19937* rng) const {
    const Transition& transition = config_.transition;
    std::vector<Command> commands;
    if (policy == SyncPolicy::kAlternate) {
      commands.push_back(BuildSetPower(!master.is_on(), transition));
      return commands;
    }
    commands.push_back(BuildSetPower(master.is_on(), transition));
    if (!master.is_on()) {
      return commands;
    }
    // Levels the master never reported are left alone on the members.
    if (master.brightness_known) {
      int brightness = master.brightness;
      if (policy == SyncPolicy::kRandom) {
        const int jitter = config_.random_brightness_jitter;
        std::uniform_int_distribution<int> offset(-jitter, jitter);
        brightness = std::clamp(brightness + offset(*rng), 1, kMaxBrightness);
      }
      commands.push_back(BuildSetBrightness(brightness, transition));
    }
    if (!master.color_known) {
      return commands;
    }
    switch (master.color.kind) {
      case Color::Kind::kRgb:
        commands.push_back(BuildSetRgb(master.color.red, master.color.green,
                                       master.color.blue, transition));
        break;
      case Color::Kind::kTemperature:
        commands.push_back(BuildSetColorTemperature(master.color.kelvin, transition));
        break;
      case Color::Kind::kWhite:
        break;
    }
    return commands;
  }

  void SendToMember(const SyncGroup& group, const std::string& member,
                    const std::vector<Command>& commands) {
    // Held across the sends so Detach() waits for them.
    std::lock_guard<std::recursive_mutex> lock(channels_mutex_);
    auto it = channels_.find(member);
    if (it == channels_.end() || it->second->state() != SessionState::kReady) {
      members_skipped_.fetch_add(1);
      RecordFailure(group.id, member, {},
                    {ErrorCode::kMemberUnreachable, "member has no ready session"});
      return;
    }
    CommandChannel* channel = it->second;
    for (const auto& command : commands) {
      commands_sent_.fetch_add(1);
      const CommandResult result = channel->Send(command, stop_token_.get());
      if (result.ok()) {
        continue;
      }
      command_failures_.fetch_add(1);
      RecordFailure(group.id, member, command.method, result.error);
      const ErrorCode code = result.error.code;
      if (code == ErrorCode::kConnectionLost || code == ErrorCode::kNotConnected ||
          code == ErrorCode::kCancelled) {
        return;
      }
    }
  }

  void RecordFailure(const std::string& group_id, const std::string& member,
                     const std::string& method, const Error& error) {
    SyncFailure failure{group_id, member, method, error};
    {
      std::lock_guard<std::mutex> lock(failures_mutex_);
      failures_.push_back(failure);
      while (failures_.size() > config_.failure_history) {
        failures_.pop_front();
      }
    }
    internal::LogMessage(config_.log_callback,
                         "Sync group " + group_id + ": " +
                             (method.empty() ? std::string("propagation") : method) +
                             " to " + member + " failed: " + error.ToString());
    FailureCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = failure_cb_;
    }
    if (cb_copy) {
      try {
        cb_copy(failure);
      } catch (...) {
        callback_exceptions_.fetch_add(1);
        internal::LogCallbackError(config_.log_callback, "SyncFailureCallback");
      }
    }
  }

  SyncMetrics Metrics() const {
    SyncMetrics metrics;
    metrics.events_received = events_received_.load();
    metrics.events_processed = events_processed_.load();
    metrics.propagations = propagations_.load();
    metrics.commands_sent = commands_sent_.load();
    metrics.command_failures = command_failures_.load();
    metrics.members_skipped = members_skipped_.load();
    metrics.callback_exceptions = callback_exceptions_.load();
    return metrics;
  }

  SyncConfig config_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::unique_ptr<CancelToken> stop_token_;
  std::thread worker_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<StateChangeEvent> queue_;
  bool busy_ = false;

  mutable std::mutex groups_mutex_;
  std::map<std::string, SyncGroup> groups_;
  uint64_t next_group_id_ = 1;

  // Recursive: a failing Send() on the worker may call back into Detach().
  std::recursive_mutex channels_mutex_;
  std::unordered_map<std::string, CommandChannel*> channels_;

  mutable std::mutex failures_mutex_;
  std::deque<SyncFailure> failures_;

  std::mutex callback_mutex_;
  FailureCallback failure_cb_;

  std::atomic<uint64_t> events_received_{0};
  std::atomic<uint64_t> events_processed_{0};
  std::atomic<uint64_t> propagations_{0};
  std::atomic<uint64_t> commands_sent_{0};
  std::atomic<uint64_t> command_failures_{0};
  std::atomic<uint64_t> members_skipped_{0};
  std::atomic<uint64_t> callback_exceptions_{0};
};

SyncCoordinator::SyncCoordinator(SyncConfig config) : impl_(new Impl(std::move(config))) {}

SyncCoordinator::~SyncCoordinator() = default;

bool SyncCoordinator::Start() { return impl_->Start(); }

void SyncCoordinator::Stop() { impl_->Stop(); }

void SyncCoordinator::Attach(CommandChannel* channel) { impl_->Attach(channel); }

void SyncCoordinator::Detach(const std::string& address) { impl_->Detach(address); }

void SyncCoordinator::HandleStateChange(const StateChangeEvent& event) {
  impl_->Enqueue(event);
}

bool SyncCoordinator::CreateGroup(SyncGroup group, std::string* id, Error* error) {
  return impl_->CreateGroup(std::move(group), id, error);
}

bool SyncCoordinator::UpdateGroup(const SyncGroup& group, Error* error) {
  return impl_->UpdateGroup(group, error);
}

bool SyncCoordinator::DeleteGroup(const std::string& id, Error* error) {
  return impl_->DeleteGroup(id, error);
}

std::optional<SyncGroup> SyncCoordinator::GetGroup(const std::string& id) const {
  return impl_->GetGroup(id);
}

std::vector<SyncGroup> SyncCoordinator::Groups() const { return impl_->Groups(); }

size_t SyncCoordinator::LoadGroups(const std::vector<SyncGroup>& groups) {
  return impl_->LoadGroups(groups);
}

void SyncCoordinator::SetFailureCallback(FailureCallback cb) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->failure_cb_ = std::move(cb);
}

std::vector<SyncFailure> SyncCoordinator::RecentFailures() const {
  std::lock_guard<std::mutex> lock(impl_->failures_mutex_);
  return std::vector<SyncFailure>(impl_->failures_.begin(), impl_->failures_.end());
}

SyncMetrics SyncCoordinator::GetMetrics() const { return impl_->Metrics(); }

bool SyncCoordinator::WaitIdle(std::chrono::milliseconds timeout) {
  return impl_->WaitIdle(timeout);
}

}  // namespace yeelight
