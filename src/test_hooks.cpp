#include "yeelight/test_hooks.h"

#ifdef YEELIGHT_TESTING

#include "mdns.h"
#include "protocol.h"
#include "ssdp.h"

#include <arpa/inet.h>

namespace yeelight {
namespace test {
namespace {

void AppendBe16(std::vector<uint8_t>* out, uint16_t value) {
  out->push_back(static_cast<uint8_t>(value >> 8));
  out->push_back(static_cast<uint8_t>(value & 0xff));
}

void AppendRecord(std::vector<uint8_t>* packet, const std::string& owner, uint16_t type,
                  const std::vector<uint8_t>& rdata) {
  const std::vector<uint8_t> name = internal::EncodeName(owner);
  packet->insert(packet->end(), name.begin(), name.end());
  AppendBe16(packet, type);
  AppendBe16(packet, internal::kDnsClassIn | internal::kDnsClassFlush);
  // TTL 120 s.
  AppendBe16(packet, 0);
  AppendBe16(packet, 120);
  AppendBe16(packet, static_cast<uint16_t>(rdata.size()));
  packet->insert(packet->end(), rdata.begin(), rdata.end());
}

std::vector<uint8_t> ResponseHeader(uint16_t answers) {
  std::vector<uint8_t> packet;
  AppendBe16(&packet, 0);
  AppendBe16(&packet, 0x8400);
  AppendBe16(&packet, 0);
  AppendBe16(&packet, answers);
  AppendBe16(&packet, 0);
  AppendBe16(&packet, 0);
  return packet;
}

std::vector<uint8_t> AddressRdata(const std::string& ip) {
  in_addr addr{};
  inet_pton(AF_INET, ip.c_str(), &addr);
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&addr.s_addr);
  return std::vector<uint8_t>(bytes, bytes + 4);
}

}  // namespace

std::string EncodeCommand(uint32_t id, const Command& command) {
  return internal::EncodeRequest(id, command);
}

bool DecodeFrame(const std::string& line, DecodedFrame* out, Error* error) {
  internal::Frame frame;
  if (!internal::DecodeFrame(line, &frame, error)) {
    return false;
  }
  if (!out) {
    return true;
  }
  switch (frame.kind) {
    case internal::Frame::Kind::kResult:
      out->kind = DecodedFrame::Kind::kResult;
      break;
    case internal::Frame::Kind::kError:
      out->kind = DecodedFrame::Kind::kError;
      break;
    case internal::Frame::Kind::kNotification:
      out->kind = DecodedFrame::Kind::kNotification;
      break;
  }
  out->id = frame.id;
  out->result = frame.result;
  out->error_code = frame.error_code;
  out->error_message = frame.error_message;
  out->method = frame.method;
  out->properties = frame.properties;
  return true;
}

LightState ApplyProperties(const LightState& previous,
                           const std::map<std::string, std::string>& properties) {
  return internal::ApplyProperties(previous, properties);
}

std::string BuildSsdpSearchRequest(const std::string& host, uint16_t port) {
  return internal::BuildSearchRequest(host, port);
}

bool ParseSsdpResponse(const std::string& text, DiscoveryResult* out) {
  return internal::ParseSearchResponse(text, out);
}

Device DeviceFromDiscoveryResult(const DiscoveryResult& result, bool seed_state) {
  return internal::DeviceFromResult(result, seed_state, Device::Clock::now());
}

std::vector<uint8_t> BuildMdnsQuery(const std::string& service, bool unicast_response) {
  return internal::BuildQuery(service, internal::kDnsTypePtr, unicast_response);
}

std::vector<uint8_t> BuildMdnsServiceResponse(const std::string& instance,
                                              const std::string& service,
                                              const std::string& host,
                                              const std::string& ip,
                                              uint16_t port) {
  const std::string instance_name = instance + "." + service;
  std::vector<uint8_t> packet = ResponseHeader(3);
  AppendRecord(&packet, service, internal::kDnsTypePtr, internal::EncodeName(instance_name));

  std::vector<uint8_t> srv;
  AppendBe16(&srv, 0);
  AppendBe16(&srv, 0);
  AppendBe16(&srv, port);
  const std::vector<uint8_t> target = internal::EncodeName(host);
  srv.insert(srv.end(), target.begin(), target.end());
  AppendRecord(&packet, instance_name, internal::kDnsTypeSrv, srv);

  AppendRecord(&packet, host, internal::kDnsTypeA, AddressRdata(ip));
  return packet;
}

std::vector<uint8_t> BuildMdnsAddressResponse(const std::string& host, const std::string& ip) {
  std::vector<uint8_t> packet = ResponseHeader(1);
  AppendRecord(&packet, host, internal::kDnsTypeA, AddressRdata(ip));
  return packet;
}

std::vector<DiscoveryResult> ParseMdnsPackets(const std::vector<std::vector<uint8_t>>& packets,
                                              const std::string& service) {
  internal::MdnsCache cache;
  for (const auto& packet : packets) {
    if (!cache.AddPacket(packet.data(), packet.size())) {
      continue;
    }
  }
  return cache.Resolve(service);
}

}  // namespace test
}  // namespace yeelight

#endif  // YEELIGHT_TESTING
