#include "protocol.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <memory>

namespace yeelight {
namespace internal {
namespace {

constexpr int kColorModeRgb = 1;
constexpr int kColorModeTemperature = 2;
constexpr int kColorModeHsv = 3;

const std::string* Find(const std::map<std::string, std::string>& properties,
                        const char* key) {
  auto it = properties.find(key);
  return it == properties.end() ? nullptr : &it->second;
}

bool FindInteger(const std::map<std::string, std::string>& properties,
                 const char* key, long long* out) {
  const std::string* text = Find(properties, key);
  return text != nullptr && ParseInteger(*text, out);
}

}  // namespace

const std::vector<std::string>& StateProperties() {
  static const std::vector<std::string> names = {
      "power", "bright", "color_mode", "ct", "rgb", "hue", "sat", "name",
  };
  return names;
}

bool ParseInteger(const std::string& text, long long* out) {
  if (text.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return false;
  }
  if (out) {
    *out = value;
  }
  return true;
}

std::string EncodeRequest(uint32_t id, const Command& command) {
  Json::Value root(Json::objectValue);
  root["id"] = static_cast<Json::UInt>(id);
  root["method"] = command.method;
  root["params"] = command.params.isArray() ? command.params
                                            : Json::Value(Json::arrayValue);
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root) + "\r\n";
}

bool DecodeFrame(const std::string& line, Frame* out, Error* error) {
  std::string text = line;
  while (!text.empty() && (text.back() == '\r' || text.back() == '\n' ||
                           text.back() == ' ')) {
    text.pop_back();
  }
  if (text.empty()) {
    return SetError(error, ErrorCode::kMalformedFrame, "empty line");
  }

  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    return SetError(error, ErrorCode::kDecodeFailure, "invalid JSON: " + errors);
  }
  if (!root.isObject()) {
    return SetError(error, ErrorCode::kMalformedFrame, "frame is not an object");
  }

  Frame frame;
  if (root.isMember("id")) {
    const Json::Value& id = root["id"];
    if (!id.isUInt()) {
      return SetError(error, ErrorCode::kMalformedFrame, "invalid id");
    }
    frame.id = static_cast<uint32_t>(id.asUInt());
    if (root.isMember("result")) {
      frame.kind = Frame::Kind::kResult;
      frame.result = root["result"];
    } else if (root.isMember("error")) {
      const Json::Value& err = root["error"];
      frame.kind = Frame::Kind::kError;
      if (err.isObject()) {
        frame.error_code = err.get("code", 0).isIntegral() ? err.get("code", 0).asInt() : 0;
        frame.error_message = err.get("message", "").isString()
                                  ? err.get("message", "").asString()
                                  : std::string();
      } else if (err.isString()) {
        frame.error_message = err.asString();
      }
      if (frame.error_message.empty()) {
        frame.error_message = "unspecified device error";
      }
    } else {
      return SetError(error, ErrorCode::kMalformedFrame,
                      "response carries neither result nor error");
    }
  } else {
    const Json::Value& method = root["method"];
    if (!method.isString()) {
      return SetError(error, ErrorCode::kMalformedFrame, "frame has no id or method");
    }
    frame.kind = Frame::Kind::kNotification;
    frame.method = method.asString();
    const Json::Value& params = root["params"];
    if (frame.method == kMethodProps && !params.isObject()) {
      return SetError(error, ErrorCode::kMalformedFrame, "props params must be an object");
    }
    if (params.isObject()) {
      for (const auto& key : params.getMemberNames()) {
        frame.properties[key] = PropertyToString(params[key]);
      }
    }
  }
  if (out) {
    *out = std::move(frame);
  }
  return true;
}

std::string PropertyToString(const Json::Value& value) {
  if (value.isString()) {
    return value.asString();
  }
  if (value.isBool()) {
    return value.asBool() ? "1" : "0";
  }
  if (value.isIntegral()) {
    return value.isUInt64() ? std::to_string(value.asLargestUInt())
                            : std::to_string(value.asLargestInt());
  }
  if (value.isDouble()) {
    return std::to_string(std::llround(value.asDouble()));
  }
  if (value.isNull()) {
    return {};
  }
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

Color HsvToRgb(int hue, int saturation) {
  const double h = std::clamp(hue, 0, 359) / 60.0;
  const double s = std::clamp(saturation, 0, 100) / 100.0;
  const double c = s;
  const double x = c * (1.0 - std::fabs(std::fmod(h, 2.0) - 1.0));
  const double m = 1.0 - c;
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
  if (h < 1.0) {
    r = c; g = x;
  } else if (h < 2.0) {
    r = x; g = c;
  } else if (h < 3.0) {
    g = c; b = x;
  } else if (h < 4.0) {
    g = x; b = c;
  } else if (h < 5.0) {
    r = x; b = c;
  } else {
    r = c; b = x;
  }
  return Color::Rgb(static_cast<int>(std::lround((r + m) * 255.0)),
                    static_cast<int>(std::lround((g + m) * 255.0)),
                    static_cast<int>(std::lround((b + m) * 255.0)));
}

LightState ApplyProperties(const LightState& previous,
                           const std::map<std::string, std::string>& properties) {
  LightState state = previous;

  const std::string* power = Find(properties, "power");
  if (power == nullptr) {
    power = Find(properties, "main_power");
  }
  if (power != nullptr) {
    if (*power == "on") {
      state.power = PowerState::kOn;
    } else if (*power == "off") {
      state.power = PowerState::kOff;
    }
  }

  long long value = 0;
  if (FindInteger(properties, "bright", &value)) {
    state.SetBrightness(static_cast<int>(std::clamp<long long>(value, 0, 100)));
  }

  long long rgb = 0;
  long long ct = 0;
  long long hue = 0;
  long long sat = 0;
  const bool has_rgb = FindInteger(properties, "rgb", &rgb) && rgb >= 0;
  const bool has_ct = FindInteger(properties, "ct", &ct) && ct > 0;
  const bool has_hsv =
      FindInteger(properties, "hue", &hue) && FindInteger(properties, "sat", &sat);
  const auto from_rgb = [&]() {
    return Color::FromPackedRgb(static_cast<uint32_t>(rgb & 0xffffff));
  };
  const auto from_ct = [&]() {
    return Color::Temperature(static_cast<int>(std::min<long long>(ct, 100000)));
  };
  const auto from_hsv = [&]() {
    return HsvToRgb(static_cast<int>(std::clamp<long long>(hue, 0, 359)),
                    static_cast<int>(std::clamp<long long>(sat, 0, 100)));
  };

  long long mode = 0;
  if (FindInteger(properties, "color_mode", &mode)) {
    // A mode switch without its value leaves the color unreported.
    if (mode == kColorModeRgb) {
      if (has_rgb) {
        state.SetColor(from_rgb());
      } else if (state.color.kind != Color::Kind::kRgb) {
        state.color = Color::Rgb(0, 0, 0);
        state.color_known = false;
      }
    } else if (mode == kColorModeTemperature) {
      if (has_ct) {
        state.SetColor(from_ct());
      } else if (state.color.kind != Color::Kind::kTemperature) {
        state.color = Color::Temperature(kMinColorTemperature);
        state.color_known = false;
      }
    } else if (mode == kColorModeHsv) {
      if (has_hsv) {
        state.SetColor(from_hsv());
      } else if (has_rgb) {
        state.SetColor(from_rgb());
      }
    }
    return state;
  }

  // Without a color mode the reported values imply it, unless ambiguous.
  if (has_rgb && !has_ct) {
    state.SetColor(from_rgb());
  } else if (has_ct && !has_rgb) {
    state.SetColor(from_ct());
  } else if (has_rgb && has_ct) {
    if (state.color.kind == Color::Kind::kRgb) {
      state.SetColor(from_rgb());
    } else if (state.color.kind == Color::Kind::kTemperature) {
      state.SetColor(from_ct());
    }
  } else if (has_hsv) {
    state.SetColor(from_hsv());
  }
  return state;
}

std::map<std::string, std::string> PropertiesFromResult(
    const std::vector<std::string>& names, const Json::Value& result) {
  std::map<std::string, std::string> properties;
  if (!result.isArray()) {
    return properties;
  }
  const Json::ArrayIndex count =
      std::min<Json::ArrayIndex>(result.size(), static_cast<Json::ArrayIndex>(names.size()));
  for (Json::ArrayIndex i = 0; i < count; ++i) {
    std::string value = PropertyToString(result[i]);
    if (!value.empty()) {
      properties[names[i]] = std::move(value);
    }
  }
  return properties;
}

}  // namespace internal
}  // namespace yeelight
