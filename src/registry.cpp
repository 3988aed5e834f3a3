#include "yeelight/registry.h"

#include "logging.h"

namespace yeelight {
namespace {

bool SameDevice(const Device& a, const Device& b) {
  return a.ip == b.ip && a.port == b.port && a.id == b.id && a.name == b.name &&
         a.model == b.model && a.firmware_version == b.firmware_version &&
         a.features == b.features && a.state == b.state &&
         a.last_seen == b.last_seen && a.connectivity == b.connectivity;
}

}  // namespace

bool RegistryConfig::Validate(std::string* error) const {
  if (unreachable_retention.count() <= 0) {
    if (error) {
      *error = "unreachable_retention must be positive";
    }
    return false;
  }
  return true;
}

Registry::Registry(RegistryConfig config) : config_(std::move(config)) {}

bool Registry::Upsert(const Device& device) {
  if (device.ip.empty()) {
    return false;
  }
  const std::string key = device.address();
  std::vector<RegistryEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(key);
    if (it == devices_.end()) {
      Record record;
      record.device = device;
      if (device.connectivity == Connectivity::kUnreachable) {
        record.unreachable_since = device.last_seen;
      }
      devices_.emplace(key, record);
      events.push_back({RegistryEventType::kAdded, device});
    } else {
      Record& record = it->second;
      const Device before = record.device;
      Device& stored = record.device;
      // Stale observations never roll state back.
      if (device.last_seen >= stored.last_seen) {
        if (device.connectivity == Connectivity::kUnreachable &&
            stored.connectivity != Connectivity::kUnreachable) {
          record.unreachable_since = device.last_seen;
        }
        stored.state = device.state;
        stored.connectivity = device.connectivity;
        stored.last_seen = device.last_seen;
      }
      if (stored.name.empty() && !device.name.empty()) {
        stored.name = device.name;
      }
      if (stored.model.empty() && !device.model.empty()) {
        stored.model = device.model;
      }
      if (stored.id == 0 && device.id != 0) {
        stored.id = device.id;
      }
      if (device.firmware_version) {
        stored.firmware_version = device.firmware_version;
      }
      if (!device.features.empty()) {
        stored.features = device.features;
      }
      if (!SameDevice(before, stored)) {
        events.push_back({RegistryEventType::kUpdated, stored});
      }
    }
  }
  Notify(events);
  return true;
}

std::optional<Device> Registry::Get(const std::string& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(address);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second.device;
}

std::vector<Device> Registry::All() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Device> result;
  result.reserve(devices_.size());
  for (const auto& entry : devices_) {
    result.push_back(entry.second.device);
  }
  return result;
}

bool Registry::Remove(const std::string& address) {
  std::vector<RegistryEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(address);
    if (it == devices_.end()) {
      return false;
    }
    events.push_back({RegistryEventType::kRemoved, it->second.device});
    devices_.erase(it);
  }
  Notify(events);
  return true;
}

bool Registry::MarkUnreachable(const std::string& address,
                               Device::Clock::time_point observed_at) {
  std::vector<RegistryEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(address);
    if (it == devices_.end()) {
      return false;
    }
    Record& record = it->second;
    if (record.device.connectivity != Connectivity::kUnreachable) {
      record.device.connectivity = Connectivity::kUnreachable;
      record.unreachable_since = observed_at;
      events.push_back({RegistryEventType::kUnreachable, record.device});
    }
  }
  Notify(events);
  return true;
}

size_t Registry::PruneUnreachable(Device::Clock::time_point now) {
  std::vector<RegistryEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.begin();
    while (it != devices_.end()) {
      if (it->second.device.connectivity == Connectivity::kUnreachable &&
          now - it->second.unreachable_since > config_.unreachable_retention) {
        events.push_back({RegistryEventType::kRemoved, it->second.device});
        it = devices_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (!events.empty()) {
    internal::LogMessage(config_.log_callback,
                         "Pruned " + std::to_string(events.size()) +
                             " unreachable device(s)");
  }
  Notify(events);
  return events.size();
}

size_t Registry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

void Registry::SetEventCallback(EventCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_cb_ = std::move(cb);
}

void Registry::Notify(const std::vector<RegistryEvent>& events) {
  if (events.empty()) {
    return;
  }
  EventCallback cb_copy;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb_copy = event_cb_;
  }
  if (!cb_copy) {
    return;
  }
  for (const auto& event : events) {
    try {
      cb_copy(event);
    } catch (...) {
      internal::LogCallbackError(config_.log_callback, "RegistryEventCallback");
    }
  }
}

}  // namespace yeelight
