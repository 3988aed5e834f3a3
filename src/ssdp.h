#pragma once

#include "yeelight/device.h"
#include "yeelight/discovery.h"

#include <cstdint>
#include <string>

namespace yeelight {
namespace internal {

std::string BuildSearchRequest(const std::string& host, uint16_t port);

/// Parse an HTTP-style search reply. Requires a yeelight:// Location header.
bool ParseSearchResponse(const std::string& text, DiscoveryResult* out);

/// Build the registry entry for a discovery answer. Light state stays Unknown
/// unless `seed_state` is set and the answer carries state headers.
Device DeviceFromResult(const DiscoveryResult& result, bool seed_state,
                        Device::Clock::time_point now);

}  // namespace internal
}  // namespace yeelight
