#pragma once

#include "yeelight/device.h"
#include "yeelight/error.h"

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace yeelight {

/**
 * Wire method names.
 */
constexpr const char kMethodSetPower[] = "set_power";
constexpr const char kMethodToggle[] = "toggle";
constexpr const char kMethodSetBright[] = "set_bright";
constexpr const char kMethodSetRgb[] = "set_rgb";
constexpr const char kMethodSetHsv[] = "set_hsv";
constexpr const char kMethodSetCtAbx[] = "set_ct_abx";
constexpr const char kMethodStartCf[] = "start_cf";
constexpr const char kMethodStopCf[] = "stop_cf";
constexpr const char kMethodSetName[] = "set_name";
constexpr const char kMethodSetDefault[] = "set_default";
constexpr const char kMethodSetMusic[] = "set_music";
constexpr const char kMethodSetAdjust[] = "set_adjust";
constexpr const char kMethodSetScene[] = "set_scene";
constexpr const char kMethodGetProp[] = "get_prop";
constexpr const char kMethodProps[] = "props";

/// Minimum duration the firmware accepts for a smooth transition.
constexpr int kMinSmoothDurationMs = 30;
/// Minimum duration of one color flow step.
constexpr int kMinFlowStepMs = 50;

/**
 * How the device moves to a new value.
 */
struct Transition {
  enum class Effect : uint8_t {
    kSudden,
    kSmooth,
  };

  Effect effect = Effect::kSmooth;
  /// Ignored for sudden; raised to kMinSmoothDurationMs for smooth.
  int duration_ms = 300;

  static Transition Sudden() { return Transition{Effect::kSudden, 0}; }
  static Transition Smooth(int duration_ms) {
    return Transition{Effect::kSmooth, duration_ms};
  }
};

enum class FlowMode : uint8_t {
  kColor = 1,
  kColorTemperature = 2,
  kSleep = 7,
};

/// What the device does after a finite flow ends.
enum class FlowAction : uint8_t {
  kRecover = 0,
  kStay = 1,
  kOff = 2,
};

struct FlowTransition {
  uint32_t duration_ms = 500;
  FlowMode mode = FlowMode::kColor;
  /// Packed RGB for kColor, kelvin for kColorTemperature, ignored for kSleep.
  uint32_t value = 0;
  /// 1-100, or -1 to leave brightness unchanged.
  int brightness = 100;
};

/**
 * Color flow (effect) executed by the device firmware.
 */
struct Flow {
  std::vector<FlowTransition> transitions;
  /// Loop forever (wire count 0).
  bool repeat = false;
  FlowAction action = FlowAction::kRecover;
};

enum class SceneKind : uint8_t {
  kColor,
  kHsv,
  kColorTemperature,
  kFlow,
  kAutoDelayOff,
};

/**
 * Target state applied in one set_scene request, turning the device on if
 * needed. Only the fields of `kind` are used.
 */
struct Scene {
  SceneKind kind = SceneKind::kColor;
  /// 1-100; unused for kFlow.
  int brightness = 100;
  /// Packed RGB for kColor, kelvin for kColorTemperature.
  uint32_t value = 0;
  int hue = 0;
  int saturation = 0;
  Flow flow;
  /// kAutoDelayOff only.
  int minutes = 0;

  static Scene Rgb(int red, int green, int blue, int brightness) {
    Scene scene;
    scene.value = Color::Rgb(red, green, blue).packed_rgb();
    scene.brightness = brightness;
    return scene;
  }
  static Scene Hsv(int hue, int saturation, int brightness) {
    Scene scene;
    scene.kind = SceneKind::kHsv;
    scene.hue = hue;
    scene.saturation = saturation;
    scene.brightness = brightness;
    return scene;
  }
  static Scene Temperature(int kelvin, int brightness) {
    Scene scene;
    scene.kind = SceneKind::kColorTemperature;
    scene.value = static_cast<uint32_t>(ClampColorTemperature(kelvin));
    scene.brightness = brightness;
    return scene;
  }
  static Scene FromFlow(const Flow& flow) {
    Scene scene;
    scene.kind = SceneKind::kFlow;
    scene.flow = flow;
    return scene;
  }
  /// Set brightness now and power off after `minutes`.
  static Scene AutoDelayOff(int brightness, int minutes) {
    Scene scene;
    scene.kind = SceneKind::kAutoDelayOff;
    scene.brightness = brightness;
    scene.minutes = minutes;
    return scene;
  }
};

/**
 * One outgoing request; the id is assigned by the session on send.
 */
struct Command {
  std::string method;
  Json::Value params{Json::arrayValue};
};

/**
 * Outcome of a command sent through a session.
 */
struct CommandResult {
  Error error;
  /// The "result" array of the response (e.g. ["ok"]).
  Json::Value result{Json::arrayValue};

  bool ok() const { return error.ok(); }
};

enum class AdjustAction : uint8_t {
  kIncrease,
  kDecrease,
  kCircle,
};

enum class AdjustProperty : uint8_t {
  kBright,
  kColorTemperature,
  kColor,
};

Command BuildSetPower(bool on, const Transition& transition = Transition::Sudden());
Command BuildToggle();
Command BuildSetBrightness(int brightness, const Transition& transition = Transition());
Command BuildSetRgb(int red, int green, int blue, const Transition& transition = Transition());
Command BuildSetHsv(int hue, int saturation, const Transition& transition = Transition());
Command BuildSetColorTemperature(int kelvin, const Transition& transition = Transition());
/// Returns a command with an empty method if the flow has no transitions.
Command BuildStartFlow(const Flow& flow);
Command BuildStopFlow();
Command BuildSetName(const std::string& name);
Command BuildSetDefault();
Command BuildSetMusic(bool enabled, const std::string& host = {}, uint16_t port = 0);
Command BuildSetAdjust(AdjustAction action, AdjustProperty property);
/// Returns a command with an empty method for a flow scene without transitions.
Command BuildSetScene(const Scene& scene);
Command BuildGetProperties(const std::vector<std::string>& names);

/// Serialize a flow as the "duration,mode,value,brightness,..." expression.
std::string FlowExpression(const Flow& flow);

}  // namespace yeelight
