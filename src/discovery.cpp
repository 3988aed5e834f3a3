#include "yeelight/discovery.h"

#include "yeelight/registry.h"

#include "logging.h"
#include "net.h"
#include "ssdp.h"

#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>

namespace yeelight {

bool DiscoveryConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (window.count() <= 0) {
    return fail("window must be positive");
  }
  if (max_retries < 0) {
    return fail("max_retries must not be negative");
  }
  if (retry_delay.count() < 0) {
    return fail("retry_delay must not be negative");
  }
  if (!internal::IsValidIpv4(ssdp_address)) {
    return fail("ssdp_address must be a valid IPv4 address");
  }
  if (ssdp_port == 0) {
    return fail("ssdp_port must be non-zero");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0" &&
      !internal::IsValidIpv4(bind_address)) {
    return fail("bind_address must be a valid IPv4 address");
  }
  if (!multicast_interface.empty() && !internal::IsValidIpv4(multicast_interface)) {
    return fail("multicast_interface must be a valid IPv4 address");
  }
  if (enable_mdns) {
    if (!internal::IsValidIpv4(mdns_address)) {
      return fail("mdns_address must be a valid IPv4 address");
    }
    if (mdns_port == 0) {
      return fail("mdns_port must be non-zero");
    }
    if (mdns_service.empty()) {
      return fail("mdns_service must not be empty");
    }
    if (mdns_requery_interval.count() <= 0) {
      return fail("mdns_requery_interval must be positive");
    }
  }
  return true;
}

struct Discovery::Impl {
  Impl(DiscoveryConfig config, Registry* registry,
       std::unique_ptr<DiscoveryProbe> ssdp_probe,
       std::unique_ptr<DiscoveryProbe> mdns_probe)
      : config_(std::move(config)),
        registry_(registry),
        ssdp_(std::move(ssdp_probe)),
        mdns_(std::move(mdns_probe)) {
    if (!ssdp_) {
      ssdp_.reset(new SsdpProbe(config_));
    }
  }

  bool Discover(std::vector<Device>* devices, Error* error, const CancelToken* cancel) {
    std::string config_error;
    if (!config_.Validate(&config_error)) {
      internal::LogMessage(config_.log_callback, config_error);
      return SetError(error, ErrorCode::kInvalidConfig, config_error);
    }
    passes_.fetch_add(1);

    std::mutex found_mutex;
    std::set<std::string> seen_ips;
    std::vector<Device> found;
    const DiscoveryProbe::ResultHandler apply = [&](const DiscoveryResult& result) {
      std::lock_guard<std::mutex> lock(found_mutex);
      if (!seen_ips.insert(result.ip).second) {
        duplicates_.fetch_add(1);
        return;
      }
      results_.fetch_add(1);
      found.push_back(Apply(result));
    };

    CancelToken mdns_stop;
    std::mutex mdns_mutex;
    std::condition_variable mdns_cv;
    bool mdns_done = true;
    std::thread mdns_thread;
    if (config_.enable_mdns && mdns_) {
      mdns_done = false;
      try {
        mdns_thread = std::thread([&]() {
          Error mdns_error;
          if (!mdns_->Run(config_.window, &mdns_stop, apply, &mdns_error)) {
            mdns_failures_.fetch_add(1);
            internal::LogMessage(config_.log_callback,
                                 "mDNS browse failed: " + mdns_error.ToString());
          }
          {
            std::lock_guard<std::mutex> lock(mdns_mutex);
            mdns_done = true;
          }
          mdns_cv.notify_all();
        });
      } catch (const std::exception& ex) {
        mdns_done = true;
        internal::LogMessage(config_.log_callback,
                             std::string("mDNS thread start failed: ") + ex.what());
      }
    }

    bool ssdp_ok = false;
    Error last_error;
    const int attempts = config_.max_retries + 1;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
      if (attempt > 1) {
        internal::LogMessage(config_.log_callback,
                             "SSDP discovery failed (" + last_error.ToString() +
                                 "), retrying in " +
                                 std::to_string(config_.retry_delay.count()) + " ms (" +
                                 std::to_string(attempts - attempt + 1) +
                                 " attempts left)");
        if (SleepFor(config_.retry_delay, cancel)) {
          break;
        }
      }
      attempts_.fetch_add(1);
      Error attempt_error;
      if (ssdp_->Run(config_.window, cancel, apply, &attempt_error)) {
        ssdp_ok = true;
        break;
      }
      ssdp_failures_.fetch_add(1);
      last_error = attempt_error;
      if (IsCancelled(cancel)) {
        break;
      }
    }

    if (!ssdp_ok) {
      mdns_stop.Cancel();
    }
    {
      std::unique_lock<std::mutex> lock(mdns_mutex);
      while (!mdns_done) {
        if (IsCancelled(cancel)) {
          mdns_stop.Cancel();
        }
        mdns_cv.wait_for(lock, internal::kWaitSlice);
      }
    }
    if (mdns_thread.joinable()) {
      mdns_thread.join();
    }

    if (devices) {
      std::lock_guard<std::mutex> lock(found_mutex);
      *devices = found;
    }
    if (IsCancelled(cancel)) {
      return SetError(error, ErrorCode::kCancelled, "discovery cancelled");
    }
    if (!ssdp_ok) {
      const std::string message = "SSDP discovery failed after " +
                                  std::to_string(attempts) +
                                  " attempt(s): " + last_error.message;
      internal::LogMessage(config_.log_callback, message);
      return SetError(error, ErrorCode::kDiscoveryFailed, message);
    }
    return true;
  }

  // Write one answer to the registry and return the stored entry.
  Device Apply(const DiscoveryResult& result) {
    Device device = internal::DeviceFromResult(result, config_.seed_state_from_reply,
                                               Device::Clock::now());
    if (!registry_) {
      return device;
    }
    const std::string address = device.address();
    if (auto existing = registry_->Get(address)) {
      // Rediscovery refreshes metadata; state belongs to the session.
      if (!config_.seed_state_from_reply || !device.state.is_known()) {
        device.state = existing->state;
      }
    }
    registry_->Upsert(device);
    auto stored = registry_->Get(address);
    return stored ? *stored : device;
  }

  DiscoveryMetrics Metrics() const {
    DiscoveryMetrics metrics;
    metrics.passes = passes_.load();
    metrics.attempts = attempts_.load();
    metrics.results = results_.load();
    metrics.duplicates = duplicates_.load();
    metrics.ssdp_failures = ssdp_failures_.load();
    metrics.mdns_failures = mdns_failures_.load();
    return metrics;
  }

  DiscoveryConfig config_;
  Registry* registry_ = nullptr;
  std::unique_ptr<DiscoveryProbe> ssdp_;
  std::unique_ptr<DiscoveryProbe> mdns_;

  std::atomic<uint64_t> passes_{0};
  std::atomic<uint64_t> attempts_{0};
  std::atomic<uint64_t> results_{0};
  std::atomic<uint64_t> duplicates_{0};
  std::atomic<uint64_t> ssdp_failures_{0};
  std::atomic<uint64_t> mdns_failures_{0};
};

Discovery::Discovery(DiscoveryConfig config, Registry* registry)
    : impl_(new Impl(config, registry, std::unique_ptr<DiscoveryProbe>(new SsdpProbe(config)),
                     std::unique_ptr<DiscoveryProbe>(new MdnsProbe(config)))) {}

Discovery::Discovery(DiscoveryConfig config, Registry* registry,
                     std::unique_ptr<DiscoveryProbe> ssdp,
                     std::unique_ptr<DiscoveryProbe> mdns)
    : impl_(new Impl(std::move(config), registry, std::move(ssdp), std::move(mdns))) {}

Discovery::~Discovery() = default;

bool Discovery::Discover(std::vector<Device>* devices, Error* error,
                         const CancelToken* cancel) {
  return impl_->Discover(devices, error, cancel);
}

const DiscoveryConfig& Discovery::config() const { return impl_->config_; }

DiscoveryMetrics Discovery::GetMetrics() const { return impl_->Metrics(); }

}  // namespace yeelight
