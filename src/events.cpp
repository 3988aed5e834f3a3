#include "yeelight/events.h"

#include "logging.h"

#include <algorithm>

namespace yeelight {

EventHub::EventHub(LogCallback log_callback)
    : log_callback_(std::move(log_callback)) {}

EventHub::SubscriptionId EventHub::Subscribe(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriptionId id = next_id_++;
  handlers_.emplace_back(id, std::move(handler));
  return id;
}

bool EventHub::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(handlers_.begin(), handlers_.end(),
                         [id](const auto& entry) { return entry.first == id; });
  if (it == handlers_.end()) {
    return false;
  }
  handlers_.erase(it);
  return true;
}

void EventHub::Publish(const StateChangeEvent& event) {
  std::vector<std::pair<SubscriptionId, Handler>> handlers_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_copy = handlers_;
  }
  for (const auto& entry : handlers_copy) {
    if (!entry.second) {
      continue;
    }
    try {
      entry.second(event);
    } catch (...) {
      handler_exceptions_.fetch_add(1);
      internal::LogCallbackError(log_callback_, "StateChangeHandler");
    }
  }
}

size_t EventHub::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.size();
}

}  // namespace yeelight
