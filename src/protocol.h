#pragma once

#include "yeelight/command.h"
#include "yeelight/device.h"
#include "yeelight/error.h"

#include <json/json.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace yeelight {
namespace internal {

/// Properties requested by RefreshState() and the keep-alive.
const std::vector<std::string>& StateProperties();

/**
 * One decoded inbound line.
 */
struct Frame {
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
  /// Notification method (e.g. "props").
  std::string method;
  /// Notification params flattened to strings.
  std::map<std::string, std::string> properties;
};

/// Serialize a request as one "\r\n"-terminated JSON line.
std::string EncodeRequest(uint32_t id, const Command& command);

/// Decode one line (terminator optional). Fails with kDecodeFailure for
/// invalid JSON and kMalformedFrame for JSON that is not a known frame.
bool DecodeFrame(const std::string& line, Frame* out, Error* error);

/// Property values arrive as strings or numbers; normalize to text.
std::string PropertyToString(const Json::Value& value);

/// Merge reported properties into the previous state.
LightState ApplyProperties(const LightState& previous,
                           const std::map<std::string, std::string>& properties);

/// Pair get_prop names with the positional result; empty values are skipped.
std::map<std::string, std::string> PropertiesFromResult(
    const std::vector<std::string>& names, const Json::Value& result);

Color HsvToRgb(int hue, int saturation);

bool ParseInteger(const std::string& text, long long* out);

}  // namespace internal
}  // namespace yeelight
