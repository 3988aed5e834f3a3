#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace yeelight {

/**
 * Default TCP control port of Yeelight devices.
 */
constexpr uint16_t kDefaultControlPort = 55443;

/**
 * Valid ranges for device-facing values.
 */
constexpr int kMinBrightness = 0;
constexpr int kMaxBrightness = 100;
constexpr int kMinColorTemperature = 1700;
constexpr int kMaxColorTemperature = 6500;

/**
 * Capabilities advertised by a device.
 */
enum class Feature : uint8_t {
  kColor = 0x01,
  kColorTemperature = 0x02,
  kBrightness = 0x04,
  kFlow = 0x08,
  kMusicMode = 0x10,
  kNightLight = 0x20,
};

class FeatureSet {
 public:
  FeatureSet() = default;

  void Add(Feature feature) { bits_ |= static_cast<uint8_t>(feature); }
  bool Has(Feature feature) const {
    return (bits_ & static_cast<uint8_t>(feature)) != 0;
  }
  bool empty() const { return bits_ == 0; }
  uint8_t bits() const { return bits_; }

  static FeatureSet FromBits(uint8_t bits) {
    FeatureSet set;
    set.bits_ = bits & 0x3f;
    return set;
  }

  /// Derive features from the space-separated method list in an SSDP
  /// "support:" header.
  static FeatureSet FromSupportList(const std::string& support);

  bool operator==(const FeatureSet& other) const { return bits_ == other.bits_; }
  bool operator!=(const FeatureSet& other) const { return bits_ != other.bits_; }

 private:
  uint8_t bits_ = 0;
};

/**
 * Light color: RGB, color temperature, or plain white.
 */
struct Color {
  enum class Kind : uint8_t {
    kWhite,
    kRgb,
    kTemperature,
  };

  Kind kind = Kind::kWhite;
  uint8_t red = 0;
  uint8_t green = 0;
  uint8_t blue = 0;
  uint16_t kelvin = 0;

  /// Channels are clamped to [0, 255].
  static Color Rgb(int red, int green, int blue);
  /// Packed 0xRRGGBB as sent on the wire.
  static Color FromPackedRgb(uint32_t packed);
  /// Clamped to [1700, 6500] K.
  static Color Temperature(int kelvin);
  static Color White() { return Color(); }

  uint32_t packed_rgb() const {
    return (static_cast<uint32_t>(red) << 16) |
           (static_cast<uint32_t>(green) << 8) | blue;
  }

  bool operator==(const Color& other) const;
  bool operator!=(const Color& other) const { return !(*this == other); }
};

enum class PowerState : uint8_t {
  kUnknown,
  kOff,
  kOn,
};

/**
 * Last-known light state. Off keeps the last brightness/color levels.
 *
 * Brightness and color start out unreported; they only count as observed
 * once a setter (or a device report) fills them in.
 */
struct LightState {
  PowerState power = PowerState::kUnknown;
  uint8_t brightness = 0;
  Color color;
  bool brightness_known = false;
  bool color_known = false;

  static LightState Unknown() { return LightState(); }
  /// Off with unreported levels.
  static LightState Off();
  static LightState On(int brightness, const Color& color);

  bool is_on() const { return power == PowerState::kOn; }
  bool is_known() const { return power != PowerState::kUnknown; }

  /// Clamped to [0, 100]. Marks the brightness as known.
  void SetBrightness(int value);
  /// Marks the color as known.
  void SetColor(const Color& value);

  bool operator==(const LightState& other) const;
  bool operator!=(const LightState& other) const { return !(*this == other); }
};

/// Clamp helpers shared by the state setters and command builders.
int ClampBrightness(int value);
int ClampChannel(int value);
int ClampColorTemperature(int value);

enum class Connectivity : uint8_t {
  kUnknown,
  kReachable,
  kUnreachable,
};

/**
 * One physical bulb.
 */
struct Device {
  using Clock = std::chrono::system_clock;

  /// IPv4 address of the device.
  std::string ip;
  /// TCP control port.
  uint16_t port = kDefaultControlPort;
  /// Vendor-assigned id (0 if unknown).
  uint64_t id = 0;
  /// Human-assigned name (may be empty).
  std::string name;
  /// Model string (e.g. "color", "mono", "ceiling4").
  std::string model;
  /// Firmware version, if reported.
  std::optional<std::string> firmware_version;
  FeatureSet features;
  LightState state;
  Clock::time_point last_seen{};
  Connectivity connectivity = Connectivity::kUnknown;

  /// Registry key, "ip:port".
  std::string address() const;
};

/// Format "ip:port".
std::string MakeAddress(const std::string& ip, uint16_t port);

/// Split "ip:port" (port optional, defaults to 55443). Returns false if malformed.
bool SplitAddress(const std::string& address, std::string* ip, uint16_t* port);

const char* PowerStateName(PowerState power);

}  // namespace yeelight
