#pragma once

#include "yeelight/yeelight.h"

#include <json/json.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace yeelight {

#ifdef YEELIGHT_TESTING
namespace test {

/// Mirror of one decoded inbound protocol line.
struct DecodedFrame {
  enum class Kind {
    kResult,
    kError,
    kNotification,
  };

  Kind kind = Kind::kResult;
  uint32_t id = 0;
  Json::Value result{Json::arrayValue};
  int error_code = 0;
  std::string error_message;
  std::string method;
  std::map<std::string, std::string> properties;
};

std::string EncodeCommand(uint32_t id, const Command& command);
bool DecodeFrame(const std::string& line, DecodedFrame* out, Error* error);

LightState ApplyProperties(const LightState& previous,
                           const std::map<std::string, std::string>& properties);

std::string BuildSsdpSearchRequest(const std::string& host, uint16_t port);
bool ParseSsdpResponse(const std::string& text, DiscoveryResult* out);
Device DeviceFromDiscoveryResult(const DiscoveryResult& result, bool seed_state);

std::vector<uint8_t> BuildMdnsQuery(const std::string& service, bool unicast_response);

/// PTR, SRV and A records announcing one instance in a single packet.
std::vector<uint8_t> BuildMdnsServiceResponse(const std::string& instance,
                                              const std::string& service,
                                              const std::string& host,
                                              const std::string& ip,
                                              uint16_t port);

/// A single A record for `host`.
std::vector<uint8_t> BuildMdnsAddressResponse(const std::string& host, const std::string& ip);

/// Feed packets through the record cache and resolve `service`.
std::vector<DiscoveryResult> ParseMdnsPackets(const std::vector<std::vector<uint8_t>>& packets,
                                              const std::string& service);

}  // namespace test
#endif

}  // namespace yeelight
