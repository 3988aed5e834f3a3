#include "mdns.h"

#include "logging.h"
#include "net.h"

#include <algorithm>
#include <cctype>

#include <arpa/inet.h>

namespace yeelight {
namespace internal {
namespace {

constexpr size_t kMaxPacketSize = 9000;
constexpr int kMaxNameDepth = 16;
constexpr int kMulticastTtl = 255;

uint16_t ReadBe16(const uint8_t* data) {
  return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

void AppendBe16(std::vector<uint8_t>* out, uint16_t value) {
  out->push_back(static_cast<uint8_t>(value >> 8));
  out->push_back(static_cast<uint8_t>(value & 0xff));
}

// Read a possibly compressed name at *offset; advances past it.
bool ReadName(const uint8_t* data, size_t length, size_t* offset, std::string* out,
              int depth = 0) {
  if (depth > kMaxNameDepth) {
    return false;
  }
  size_t pos = *offset;
  bool jumped = false;
  std::string name;
  while (pos < length) {
    const uint8_t label = data[pos++];
    if (label == 0) {
      if (!jumped) {
        *offset = pos;
      }
      *out = name;
      return true;
    }
    if ((label & 0xc0) == 0xc0) {
      if (pos >= length) {
        return false;
      }
      size_t pointer = static_cast<size_t>(((label & 0x3f) << 8) | data[pos++]);
      if (pointer >= length) {
        return false;
      }
      std::string rest;
      if (!ReadName(data, length, &pointer, &rest, depth + 1)) {
        return false;
      }
      if (!jumped) {
        *offset = pos;
      }
      if (!name.empty() && !rest.empty()) {
        name.push_back('.');
      }
      *out = name + rest;
      return true;
    }
    if (pos + label > length) {
      return false;
    }
    if (!name.empty()) {
      name.push_back('.');
    }
    name.append(reinterpret_cast<const char*>(data + pos), label);
    pos += label;
  }
  return false;
}

}  // namespace

std::string CanonicalName(const std::string& name) {
  size_t end = name.size();
  while (end > 0 && name[end - 1] == '.') {
    --end;
  }
  std::string out;
  out.reserve(end);
  for (size_t i = 0; i < end; ++i) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
  }
  return out;
}

std::vector<uint8_t> EncodeName(const std::string& name) {
  std::vector<uint8_t> out;
  size_t start = 0;
  const std::string trimmed = name.size() > 0 && name.back() == '.'
                                  ? name.substr(0, name.size() - 1)
                                  : name;
  while (start <= trimmed.size()) {
    size_t dot = trimmed.find('.', start);
    if (dot == std::string::npos) {
      dot = trimmed.size();
    }
    const size_t label_length = dot - start;
    if (label_length > 63) {
      return {};
    }
    if (label_length > 0) {
      out.push_back(static_cast<uint8_t>(label_length));
      out.insert(out.end(), trimmed.begin() + start, trimmed.begin() + dot);
    }
    start = dot + 1;
  }
  out.push_back(0);
  return out;
}

std::vector<uint8_t> BuildQuery(const std::string& name, uint16_t type,
                                bool unicast_response) {
  const std::vector<uint8_t> encoded = EncodeName(name);
  if (encoded.empty()) {
    return {};
  }
  std::vector<uint8_t> packet(kDnsHeaderSize, 0);
  // id 0, flags 0, one question.
  packet[5] = 1;
  packet.insert(packet.end(), encoded.begin(), encoded.end());
  AppendBe16(&packet, type);
  AppendBe16(&packet, static_cast<uint16_t>(kDnsClassIn |
                                            (unicast_response ? kDnsClassQu : 0)));
  return packet;
}

bool MdnsCache::AddPacket(const uint8_t* data, size_t length) {
  if (data == nullptr || length < kDnsHeaderSize) {
    return false;
  }
  const uint16_t questions = ReadBe16(data + 4);
  const uint32_t records = static_cast<uint32_t>(ReadBe16(data + 6)) +
                           ReadBe16(data + 8) + ReadBe16(data + 10);
  size_t offset = kDnsHeaderSize;
  for (uint16_t i = 0; i < questions; ++i) {
    std::string ignored;
    if (!ReadName(data, length, &offset, &ignored) || offset + 4 > length) {
      return false;
    }
    offset += 4;
  }
  for (uint32_t i = 0; i < records; ++i) {
    if (!ParseRecord(data, length, &offset)) {
      return false;
    }
  }
  return true;
}

bool MdnsCache::ParseRecord(const uint8_t* data, size_t length, size_t* offset) {
  std::string owner;
  if (!ReadName(data, length, offset, &owner)) {
    return false;
  }
  if (*offset + 10 > length) {
    return false;
  }
  const uint8_t* fixed = data + *offset;
  const uint16_t type = ReadBe16(fixed);
  const uint16_t klass = ReadBe16(fixed + 2) & static_cast<uint16_t>(~kDnsClassFlush);
  const uint16_t rdlength = ReadBe16(fixed + 8);
  const size_t rdata = *offset + 10;
  const size_t next = rdata + rdlength;
  if (next > length) {
    return false;
  }
  *offset = next;
  if (klass != kDnsClassIn) {
    return true;
  }

  const std::string owner_key = CanonicalName(owner);
  if (type == kDnsTypePtr) {
    size_t pos = rdata;
    std::string instance;
    if (ReadName(data, length, &pos, &instance) && !instance.empty()) {
      const std::string key = CanonicalName(instance);
      pointers_[owner_key].insert(key);
      display_names_.emplace(key, instance);
    }
  } else if (type == kDnsTypeSrv) {
    if (rdlength < 6) {
      return true;
    }
    size_t pos = rdata + 6;
    std::string target;
    if (ReadName(data, length, &pos, &target) && !target.empty()) {
      Service service;
      service.port = ReadBe16(data + rdata + 4);
      service.target = CanonicalName(target);
      services_[owner_key] = service;
      display_names_.emplace(owner_key, owner);
    }
  } else if (type == kDnsTypeA && rdlength == 4) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, data + rdata, ip, sizeof(ip)) != nullptr) {
      auto& list = addresses_[owner_key];
      if (std::find(list.begin(), list.end(), ip) == list.end()) {
        list.push_back(ip);
      }
    }
  }
  return true;
}

std::vector<DiscoveryResult> MdnsCache::Resolve(const std::string& service) const {
  std::vector<DiscoveryResult> results;
  auto ptr = pointers_.find(CanonicalName(service));
  if (ptr == pointers_.end()) {
    return results;
  }
  for (const auto& instance : ptr->second) {
    auto srv = services_.find(instance);
    if (srv == services_.end()) {
      continue;
    }
    auto addrs = addresses_.find(srv->second.target);
    if (addrs == addresses_.end() || addrs->second.empty()) {
      continue;
    }
    DiscoveryResult result;
    result.ip = addrs->second.front();
    result.port = srv->second.port != 0 ? srv->second.port : kDefaultControlPort;
    auto display = display_names_.find(instance);
    result.payload = display != display_names_.end() ? display->second : instance;
    result.source = DiscoverySource::kMdns;
    results.push_back(result);
  }
  return results;
}

std::vector<std::string> MdnsCache::UnresolvedHosts(const std::string& service) const {
  std::vector<std::string> hosts;
  auto ptr = pointers_.find(CanonicalName(service));
  if (ptr == pointers_.end()) {
    return hosts;
  }
  for (const auto& instance : ptr->second) {
    auto srv = services_.find(instance);
    if (srv == services_.end() || addresses_.count(srv->second.target) != 0) {
      continue;
    }
    if (std::find(hosts.begin(), hosts.end(), srv->second.target) == hosts.end()) {
      hosts.push_back(srv->second.target);
    }
  }
  return hosts;
}

}  // namespace internal

MdnsProbe::MdnsProbe(DiscoveryConfig config) : config_(std::move(config)) {}

bool MdnsProbe::Run(std::chrono::milliseconds window, const CancelToken* cancel,
                    const ResultHandler& on_result, Error* error) {
  internal::UdpSocket socket;
  bool unicast_fallback = false;
  if (!socket.Open(config_.mdns_port, config_.bind_address, true)) {
    // Another responder owns the port: ask for unicast replies instead.
    internal::LogMessage(config_.log_callback,
                         "mDNS port unavailable (" + socket.last_error() +
                             "), falling back to unicast responses");
    if (!socket.Open(0, config_.bind_address, false)) {
      return SetError(error, ErrorCode::kSocketError, socket.last_error());
    }
    unicast_fallback = true;
  }
  if (!unicast_fallback &&
      !socket.JoinMulticast(config_.mdns_address, config_.multicast_interface)) {
    internal::LogMessage(config_.log_callback,
                         "mDNS join failed (" + socket.last_error() +
                             "), requesting unicast responses");
    unicast_fallback = true;
  }
  if (!config_.multicast_interface.empty() &&
      !socket.SetMulticastInterface(config_.multicast_interface)) {
    return SetError(error, ErrorCode::kSocketError, socket.last_error());
  }
  if (!socket.SetMulticastTtl(internal::kMulticastTtl)) {
    internal::LogMessage(config_.log_callback, socket.last_error());
  }

  const sockaddr_in dest = internal::MakeSockaddr(config_.mdns_address, config_.mdns_port);
  auto send_query = [&](const std::string& name, uint16_t type) {
    const std::vector<uint8_t> query = internal::BuildQuery(name, type, unicast_fallback);
    if (query.empty()) {
      return false;
    }
    const ssize_t sent = socket.SendTo(query, dest);
    return sent >= 0 && static_cast<size_t>(sent) == query.size();
  };
  if (!send_query(config_.mdns_service, internal::kDnsTypePtr)) {
    return SetError(error, ErrorCode::kSocketError, internal::ErrnoMessage("sendto(mDNS query)"));
  }

  internal::MdnsCache cache;
  std::set<std::string> reported;
  std::vector<uint8_t> buffer(internal::kMaxPacketSize);
  const auto start = std::chrono::steady_clock::now();
  const auto deadline = start + window;
  auto next_query = start + config_.mdns_requery_interval;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    if (now >= next_query) {
      // Lost datagrams are common; failures here are not fatal.
      send_query(config_.mdns_service, internal::kDnsTypePtr);
      for (const auto& host : cache.UnresolvedHosts(config_.mdns_service)) {
        send_query(host, internal::kDnsTypeA);
      }
      next_query = now + config_.mdns_requery_interval;
    }
    const auto until = std::min(deadline, next_query);
    const auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
    const auto wait = internal::WaitReadable(socket.fd(), slice, cancel);
    if (wait == internal::WaitResult::kCancelled) {
      return true;
    }
    if (wait == internal::WaitResult::kTimeout) {
      continue;
    }
    if (wait == internal::WaitResult::kError) {
      return SetError(error, ErrorCode::kSocketError, internal::ErrnoMessage("select()"));
    }
    sockaddr_in src{};
    socklen_t src_len = sizeof(src);
    const ssize_t n = socket.RecvFrom(buffer.data(), buffer.size(), &src, &src_len);
    if (n <= 0) {
      continue;
    }
    if (!cache.AddPacket(buffer.data(), static_cast<size_t>(n))) {
      continue;
    }
    for (const auto& result : cache.Resolve(config_.mdns_service)) {
      if (!reported.insert(internal::CanonicalName(result.payload)).second) {
        continue;
      }
      if (on_result) {
        on_result(result);
      }
    }
  }
}

}  // namespace yeelight
