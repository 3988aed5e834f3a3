#pragma once

#include "yeelight/device.h"
#include "yeelight/error.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace yeelight {

/**
 * Registry lifecycle events.
 */
enum class RegistryEventType {
  kAdded,
  kUpdated,
  kUnreachable,
  kRemoved,
};

struct RegistryEvent {
  RegistryEventType type = RegistryEventType::kAdded;
  Device device;
};

struct RegistryConfig {
  /// How long an unreachable device is retained before PruneUnreachable drops it.
  std::chrono::milliseconds unreachable_retention{std::chrono::minutes(10)};
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * Authoritative in-memory map from device address to Device.
 *
 * All access is serialized by one mutex; callers never observe a partially
 * merged device. The event callback is invoked after the lock is released.
 */
class Registry {
 public:
  using EventCallback = std::function<void(const RegistryEvent&)>;

  Registry() = default;
  explicit Registry(RegistryConfig config);

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  /// Insert or merge by address. Returns false if the device has no ip.
  bool Upsert(const Device& device);
  std::optional<Device> Get(const std::string& address) const;
  /// Snapshot copy; ordering is not stable.
  std::vector<Device> All() const;
  /// Returns false if the address was unknown.
  bool Remove(const std::string& address);
  /// Returns false if the address was unknown.
  bool MarkUnreachable(const std::string& address, Device::Clock::time_point observed_at);
  /// Drop devices unreachable for longer than the retention threshold.
  size_t PruneUnreachable(Device::Clock::time_point now);
  size_t size() const;

  void SetEventCallback(EventCallback cb);

 private:
  struct Record {
    Device device;
    Device::Clock::time_point unreachable_since{};
  };

  void Notify(const std::vector<RegistryEvent>& events);

  RegistryConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Record> devices_;

  std::mutex callback_mutex_;
  EventCallback event_cb_;
};

}  // namespace yeelight
