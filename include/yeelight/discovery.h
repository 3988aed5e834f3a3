#pragma once

#include "yeelight/cancel.h"
#include "yeelight/device.h"
#include "yeelight/error.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace yeelight {

class Registry;

/**
 * Well-known discovery endpoints.
 */
constexpr const char kSsdpMulticastAddress[] = "239.255.255.250";
constexpr uint16_t kSsdpPort = 1982;
constexpr const char kSsdpSearchTarget[] = "wifi_bulb";
constexpr const char kMdnsMulticastAddress[] = "224.0.0.251";
constexpr uint16_t kMdnsPort = 5353;
constexpr const char kMdnsServiceType[] = "_yeelight._tcp.local";

enum class DiscoverySource : uint8_t {
  kSsdp,
  kMdns,
};

/**
 * One answer from a discovery probe. Consumed immediately to update the
 * registry; never persisted.
 */
struct DiscoveryResult {
  std::string ip;
  uint16_t port = kDefaultControlPort;
  /// Raw SSDP reply text, or the resolved mDNS instance name.
  std::string payload;
  DiscoverySource source = DiscoverySource::kSsdp;
  /// SSDP reply headers keyed by lowercase name (empty for mDNS).
  std::map<std::string, std::string> headers;
};

struct DiscoveryConfig {
  /// Listen window of one probe pass.
  std::chrono::milliseconds window{5000};
  /// How often a failed SSDP phase is retried before giving up.
  int max_retries = 3;
  /// Fixed delay between retries.
  std::chrono::milliseconds retry_delay{2000};

  /// SSDP destination (multicast group or, for tests, a unicast responder).
  std::string ssdp_address = kSsdpMulticastAddress;
  uint16_t ssdp_port = kSsdpPort;
  /// Local bind address for probe sockets.
  std::string bind_address = "0.0.0.0";
  /// Outgoing multicast interface (IPv4). Empty lets the OS choose.
  std::string multicast_interface;

  /// Run the mDNS browse alongside SSDP.
  bool enable_mdns = true;
  std::string mdns_address = kMdnsMulticastAddress;
  uint16_t mdns_port = kMdnsPort;
  std::string mdns_service = kMdnsServiceType;
  /// Re-send the PTR query this often within the window.
  std::chrono::milliseconds mdns_requery_interval{1000};

  /// Fill the initial light state from power/bright/ct/rgb reply headers.
  /// Off by default: new devices stay Unknown until their session reports.
  bool seed_state_from_reply = false;

  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  bool Validate(std::string* error = nullptr) const;
};

/**
 * One discovery mechanism.
 */
class DiscoveryProbe {
 public:
  using ResultHandler = std::function<void(const DiscoveryResult&)>;

  virtual ~DiscoveryProbe() = default;

  virtual const char* name() const = 0;

  /**
   * Probe the network and listen for `window`, reporting each answer.
   *
   * @return false on a hard failure (socket, bind, send). Zero answers is a
   *         successful run. Cancellation ends the run early and returns true.
   */
  virtual bool Run(std::chrono::milliseconds window, const CancelToken* cancel,
                   const ResultHandler& on_result, Error* error) = 0;
};

/**
 * SSDP M-SEARCH probe over UDP multicast.
 */
class SsdpProbe : public DiscoveryProbe {
 public:
  explicit SsdpProbe(DiscoveryConfig config);

  const char* name() const override { return "ssdp"; }
  bool Run(std::chrono::milliseconds window, const CancelToken* cancel,
           const ResultHandler& on_result, Error* error) override;

  /// Replies dropped because they could not be parsed.
  uint64_t malformed_replies() const { return malformed_replies_.load(); }

 private:
  DiscoveryConfig config_;
  std::atomic<uint64_t> malformed_replies_{0};
};

/**
 * mDNS browse for the Yeelight service type (PTR -> SRV -> A).
 */
class MdnsProbe : public DiscoveryProbe {
 public:
  explicit MdnsProbe(DiscoveryConfig config);

  const char* name() const override { return "mdns"; }
  bool Run(std::chrono::milliseconds window, const CancelToken* cancel,
           const ResultHandler& on_result, Error* error) override;

 private:
  DiscoveryConfig config_;
};

struct DiscoveryMetrics {
  uint64_t passes = 0;
  uint64_t attempts = 0;
  uint64_t results = 0;
  uint64_t duplicates = 0;
  uint64_t ssdp_failures = 0;
  uint64_t mdns_failures = 0;
};

/**
 * Runs SSDP and mDNS probes concurrently, deduplicates answers by ip and
 * applies them to the registry.
 */
class Discovery {
 public:
  /// Uses the socket-backed SsdpProbe and MdnsProbe.
  Discovery(DiscoveryConfig config, Registry* registry);
  /// Custom probes; `mdns` may be null to disable the second mechanism.
  Discovery(DiscoveryConfig config, Registry* registry,
            std::unique_ptr<DiscoveryProbe> ssdp,
            std::unique_ptr<DiscoveryProbe> mdns);
  ~Discovery();

  Discovery(const Discovery&) = delete;
  Discovery& operator=(const Discovery&) = delete;

  /**
   * Run one discovery pass with the configured retry policy.
   *
   * @param devices Devices found in this pass, as stored in the registry.
   * @return true on success (possibly with no devices). On cancellation
   *         returns false with kCancelled; devices holds what was gathered.
   *         After exhausting retries returns false with kDiscoveryFailed.
   */
  bool Discover(std::vector<Device>* devices, Error* error = nullptr,
                const CancelToken* cancel = nullptr);

  const DiscoveryConfig& config() const;
  DiscoveryMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace yeelight
