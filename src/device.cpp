#include "yeelight/device.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include <arpa/inet.h>

namespace yeelight {

int ClampBrightness(int value) {
  return std::clamp(value, kMinBrightness, kMaxBrightness);
}

int ClampChannel(int value) { return std::clamp(value, 0, 255); }

int ClampColorTemperature(int value) {
  return std::clamp(value, kMinColorTemperature, kMaxColorTemperature);
}

FeatureSet FeatureSet::FromSupportList(const std::string& support) {
  FeatureSet set;
  std::istringstream iss(support);
  std::string method;
  while (iss >> method) {
    if (method == "set_rgb" || method == "set_hsv") {
      set.Add(Feature::kColor);
    } else if (method == "set_ct_abx") {
      set.Add(Feature::kColorTemperature);
    } else if (method == "set_bright") {
      set.Add(Feature::kBrightness);
    } else if (method == "start_cf") {
      set.Add(Feature::kFlow);
    } else if (method == "set_music") {
      set.Add(Feature::kMusicMode);
    } else if (method == "bg_set_power") {
      set.Add(Feature::kNightLight);
    }
  }
  return set;
}

Color Color::Rgb(int red, int green, int blue) {
  Color color;
  color.kind = Kind::kRgb;
  color.red = static_cast<uint8_t>(ClampChannel(red));
  color.green = static_cast<uint8_t>(ClampChannel(green));
  color.blue = static_cast<uint8_t>(ClampChannel(blue));
  return color;
}

Color Color::FromPackedRgb(uint32_t packed) {
  return Rgb(static_cast<int>((packed >> 16) & 0xff),
             static_cast<int>((packed >> 8) & 0xff),
             static_cast<int>(packed & 0xff));
}

Color Color::Temperature(int kelvin) {
  Color color;
  color.kind = Kind::kTemperature;
  color.kelvin = static_cast<uint16_t>(ClampColorTemperature(kelvin));
  return color;
}

bool Color::operator==(const Color& other) const {
  if (kind != other.kind) {
    return false;
  }
  switch (kind) {
    case Kind::kRgb:
      return red == other.red && green == other.green && blue == other.blue;
    case Kind::kTemperature:
      return kelvin == other.kelvin;
    case Kind::kWhite:
      return true;
  }
  return false;
}

LightState LightState::Off() {
  LightState state;
  state.power = PowerState::kOff;
  return state;
}

LightState LightState::On(int brightness, const Color& color) {
  LightState state;
  state.power = PowerState::kOn;
  state.SetBrightness(brightness);
  state.SetColor(color);
  return state;
}

void LightState::SetBrightness(int value) {
  brightness = static_cast<uint8_t>(ClampBrightness(value));
  brightness_known = true;
}

void LightState::SetColor(const Color& value) {
  color = value;
  color_known = true;
}

bool LightState::operator==(const LightState& other) const {
  return power == other.power && brightness == other.brightness &&
         color == other.color && brightness_known == other.brightness_known &&
         color_known == other.color_known;
}

std::string Device::address() const { return MakeAddress(ip, port); }

std::string MakeAddress(const std::string& ip, uint16_t port) {
  return ip + ":" + std::to_string(port);
}

bool SplitAddress(const std::string& address, std::string* ip, uint16_t* port) {
  std::string host = address;
  uint16_t parsed_port = kDefaultControlPort;
  const auto colon = address.rfind(':');
  if (colon != std::string::npos) {
    host = address.substr(0, colon);
    const std::string port_text = address.substr(colon + 1);
    if (port_text.empty() || port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
      return false;
    }
    const long value = std::strtol(port_text.c_str(), nullptr, 10);
    if (value <= 0 || value > 65535) {
      return false;
    }
    parsed_port = static_cast<uint16_t>(value);
  }
  in_addr parsed{};
  if (host.empty() || inet_pton(AF_INET, host.c_str(), &parsed) != 1) {
    return false;
  }
  if (ip) {
    *ip = host;
  }
  if (port) {
    *port = parsed_port;
  }
  return true;
}

const char* PowerStateName(PowerState power) {
  switch (power) {
    case PowerState::kUnknown:
      return "unknown";
    case PowerState::kOff:
      return "off";
    case PowerState::kOn:
      return "on";
  }
  return "unknown";
}

}  // namespace yeelight
