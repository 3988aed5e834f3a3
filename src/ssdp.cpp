#include "ssdp.h"

#include "logging.h"
#include "net.h"
#include "protocol.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace yeelight {
namespace internal {
namespace {

constexpr size_t kMaxReplySize = 2048;
constexpr char kLocationScheme[] = "yeelight://";
constexpr char kInstancePrefix[] = "yeelink-light-";

std::string Trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

// "yeelink-light-color1_miio12345" -> "color1".
std::string ModelFromInstance(const std::string& instance) {
  const std::string lower = ToLower(instance);
  if (!StartsWith(lower, kInstancePrefix)) {
    return {};
  }
  const std::string rest = instance.substr(sizeof(kInstancePrefix) - 1);
  return rest.substr(0, rest.find_first_of("_."));
}

}  // namespace

std::string BuildSearchRequest(const std::string& host, uint16_t port) {
  std::ostringstream oss;
  oss << "M-SEARCH * HTTP/1.1\r\n"
      << "HOST: " << host << ":" << port << "\r\n"
      << "MAN: \"ssdp:discover\"\r\n"
      << "ST: " << kSsdpSearchTarget << "\r\n"
      << "\r\n";
  return oss.str();
}

bool ParseSearchResponse(const std::string& text, DiscoveryResult* out) {
  std::istringstream stream(text);
  std::string line;
  if (!std::getline(stream, line)) {
    return false;
  }
  const std::string status = ToLower(Trim(line));
  if (!StartsWith(status, "http/1.1 200") && !StartsWith(status, "notify")) {
    return false;
  }

  std::map<std::string, std::string> headers;
  while (std::getline(stream, line)) {
    const std::string trimmed = Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    const auto colon = trimmed.find(':');
    if (colon == std::string::npos || colon == 0) {
      continue;
    }
    headers[ToLower(Trim(trimmed.substr(0, colon)))] = Trim(trimmed.substr(colon + 1));
  }

  auto location = headers.find("location");
  if (location == headers.end()) {
    return false;
  }
  const std::string& url = location->second;
  if (!StartsWith(ToLower(url), kLocationScheme)) {
    return false;
  }
  std::string hostport = url.substr(sizeof(kLocationScheme) - 1);
  const auto slash = hostport.find('/');
  if (slash != std::string::npos) {
    hostport.resize(slash);
  }
  std::string ip;
  uint16_t port = kDefaultControlPort;
  if (!SplitAddress(hostport, &ip, &port)) {
    return false;
  }
  if (out) {
    out->ip = ip;
    out->port = port;
    out->payload = text;
    out->source = DiscoverySource::kSsdp;
    out->headers = std::move(headers);
  }
  return true;
}

Device DeviceFromResult(const DiscoveryResult& result, bool seed_state,
                        Device::Clock::time_point now) {
  Device device;
  device.ip = result.ip;
  device.port = result.port;
  device.last_seen = now;
  device.connectivity = Connectivity::kReachable;

  const auto& headers = result.headers;
  auto header = [&](const char* key) -> std::string {
    auto it = headers.find(key);
    return it == headers.end() ? std::string() : it->second;
  };

  const std::string id = header("id");
  if (!id.empty()) {
    device.id = std::strtoull(id.c_str(), nullptr, 16);
  }
  device.model = header("model");
  device.name = header("name");
  const std::string firmware = header("fw_ver");
  if (!firmware.empty()) {
    device.firmware_version = firmware;
  }
  device.features = FeatureSet::FromSupportList(header("support"));

  if (result.source == DiscoverySource::kMdns && device.model.empty()) {
    device.model = ModelFromInstance(result.payload);
  }
  if (ToLower(device.model).find("ceiling") != std::string::npos) {
    device.features.Add(Feature::kNightLight);
  }
  if (seed_state) {
    device.state = ApplyProperties(LightState::Unknown(), headers);
  }
  return device;
}

}  // namespace internal

SsdpProbe::SsdpProbe(DiscoveryConfig config) : config_(std::move(config)) {}

bool SsdpProbe::Run(std::chrono::milliseconds window, const CancelToken* cancel,
                    const ResultHandler& on_result, Error* error) {
  internal::UdpSocket socket;
  if (!socket.Open(0, config_.bind_address, false)) {
    return SetError(error, ErrorCode::kSocketError, socket.last_error());
  }
  if (!config_.multicast_interface.empty() &&
      !socket.SetMulticastInterface(config_.multicast_interface)) {
    return SetError(error, ErrorCode::kSocketError, socket.last_error());
  }

  const std::string request =
      internal::BuildSearchRequest(config_.ssdp_address, config_.ssdp_port);
  const sockaddr_in dest = internal::MakeSockaddr(config_.ssdp_address, config_.ssdp_port);
  const ssize_t sent = socket.SendTo(request, dest);
  if (sent < 0 || static_cast<size_t>(sent) != request.size()) {
    return SetError(error, ErrorCode::kSocketError,
                    sent < 0 ? internal::ErrnoMessage("sendto(M-SEARCH)")
                             : std::string("partial send of M-SEARCH"));
  }

  const auto deadline = std::chrono::steady_clock::now() + window;
  uint8_t buffer[internal::kMaxReplySize];
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const auto wait = internal::WaitReadable(socket.fd(), remaining, cancel);
    if (wait == internal::WaitResult::kCancelled || wait == internal::WaitResult::kTimeout) {
      return true;
    }
    if (wait == internal::WaitResult::kError) {
      return SetError(error, ErrorCode::kSocketError, internal::ErrnoMessage("select()"));
    }
    sockaddr_in src{};
    socklen_t src_len = sizeof(src);
    const ssize_t n = socket.RecvFrom(buffer, sizeof(buffer), &src, &src_len);
    if (n <= 0) {
      continue;
    }
    DiscoveryResult result;
    if (!internal::ParseSearchResponse(
            std::string(reinterpret_cast<const char*>(buffer), static_cast<size_t>(n)),
            &result)) {
      malformed_replies_.fetch_add(1);
      continue;
    }
    if (on_result) {
      on_result(result);
    }
  }
}

}  // namespace yeelight
