#pragma once

#include "yeelight/device.h"
#include "yeelight/error.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace yeelight {

/**
 * Observed state change of one device.
 */
struct StateChangeEvent {
  /// Device address ("ip:port").
  std::string address;
  LightState previous;
  LightState current;
  /// Raw property strings carried by the push (e.g. {"power":"on"}).
  std::map<std::string, std::string> properties;
  Device::Clock::time_point observed_at{};
};

/**
 * Callback registration point for state-change events.
 *
 * Publish() invokes subscribers synchronously, in subscription order, on the
 * publishing thread. Each control session publishes from its single reader
 * thread, so events of one device arrive in the order the session received
 * them. No order is guaranteed across devices.
 */
class EventHub {
 public:
  using Handler = std::function<void(const StateChangeEvent&)>;
  using SubscriptionId = uint64_t;

  EventHub() = default;
  explicit EventHub(LogCallback log_callback);

  EventHub(const EventHub&) = delete;
  EventHub& operator=(const EventHub&) = delete;

  SubscriptionId Subscribe(Handler handler);
  /// Returns false if the id was not subscribed.
  bool Unsubscribe(SubscriptionId id);
  void Publish(const StateChangeEvent& event);

  size_t subscriber_count() const;
  uint64_t handler_exceptions() const { return handler_exceptions_.load(); }

 private:
  LogCallback log_callback_;
  mutable std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::vector<std::pair<SubscriptionId, Handler>> handlers_;
  std::atomic<uint64_t> handler_exceptions_{0};
};

}  // namespace yeelight
