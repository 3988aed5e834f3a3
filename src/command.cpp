#include "yeelight/command.h"

#include <algorithm>
#include <sstream>

namespace yeelight {
namespace {

const char* EffectName(const Transition& transition) {
  return transition.effect == Transition::Effect::kSudden ? "sudden" : "smooth";
}

int EffectDuration(const Transition& transition) {
  if (transition.effect == Transition::Effect::kSudden) {
    return 0;
  }
  return std::max(transition.duration_ms, kMinSmoothDurationMs);
}

// Append the trailing effect/duration pair shared by most setters.
void AppendTransition(Json::Value* params, const Transition& transition) {
  params->append(EffectName(transition));
  params->append(EffectDuration(transition));
}

Command MakeCommand(const char* method) {
  Command command;
  command.method = method;
  return command;
}

const char* AdjustActionName(AdjustAction action) {
  switch (action) {
    case AdjustAction::kIncrease:
      return "increase";
    case AdjustAction::kDecrease:
      return "decrease";
    case AdjustAction::kCircle:
      return "circle";
  }
  return "circle";
}

const char* AdjustPropertyName(AdjustProperty property) {
  switch (property) {
    case AdjustProperty::kBright:
      return "bright";
    case AdjustProperty::kColorTemperature:
      return "ct";
    case AdjustProperty::kColor:
      return "color";
  }
  return "bright";
}

}  // namespace

Command BuildSetPower(bool on, const Transition& transition) {
  Command command = MakeCommand(kMethodSetPower);
  command.params.append(on ? "on" : "off");
  AppendTransition(&command.params, transition);
  return command;
}

Command BuildToggle() { return MakeCommand(kMethodToggle); }

Command BuildSetBrightness(int brightness, const Transition& transition) {
  Command command = MakeCommand(kMethodSetBright);
  // Devices reject 0; "off" is expressed through set_power.
  command.params.append(std::max(ClampBrightness(brightness), 1));
  AppendTransition(&command.params, transition);
  return command;
}

Command BuildSetRgb(int red, int green, int blue, const Transition& transition) {
  Command command = MakeCommand(kMethodSetRgb);
  command.params.append(static_cast<Json::UInt>(Color::Rgb(red, green, blue).packed_rgb()));
  AppendTransition(&command.params, transition);
  return command;
}

Command BuildSetHsv(int hue, int saturation, const Transition& transition) {
  Command command = MakeCommand(kMethodSetHsv);
  command.params.append(std::clamp(hue, 0, 359));
  command.params.append(std::clamp(saturation, 0, 100));
  AppendTransition(&command.params, transition);
  return command;
}

Command BuildSetColorTemperature(int kelvin, const Transition& transition) {
  Command command = MakeCommand(kMethodSetCtAbx);
  command.params.append(ClampColorTemperature(kelvin));
  AppendTransition(&command.params, transition);
  return command;
}

std::string FlowExpression(const Flow& flow) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& step : flow.transitions) {
    if (!first) {
      oss << ",";
    }
    first = false;
    const uint32_t duration =
        std::max<uint32_t>(step.duration_ms, static_cast<uint32_t>(kMinFlowStepMs));
    uint32_t value = 0;
    int brightness = -1;
    switch (step.mode) {
      case FlowMode::kColor:
        value = step.value & 0xffffff;
        brightness = step.brightness < 0 ? -1 : std::clamp(step.brightness, 1, 100);
        break;
      case FlowMode::kColorTemperature:
        value = static_cast<uint32_t>(
            ClampColorTemperature(static_cast<int>(std::min<uint32_t>(step.value, 100000))));
        brightness = step.brightness < 0 ? -1 : std::clamp(step.brightness, 1, 100);
        break;
      case FlowMode::kSleep:
        brightness = 0;
        break;
    }
    oss << duration << "," << static_cast<int>(step.mode) << "," << value << ","
        << brightness;
  }
  return oss.str();
}

Command BuildStartFlow(const Flow& flow) {
  if (flow.transitions.empty()) {
    return Command{};
  }
  Command command = MakeCommand(kMethodStartCf);
  const Json::UInt count =
      flow.repeat ? 0 : static_cast<Json::UInt>(flow.transitions.size());
  command.params.append(count);
  command.params.append(static_cast<int>(flow.action));
  command.params.append(FlowExpression(flow));
  return command;
}

Command BuildStopFlow() { return MakeCommand(kMethodStopCf); }

Command BuildSetName(const std::string& name) {
  Command command = MakeCommand(kMethodSetName);
  command.params.append(name);
  return command;
}

Command BuildSetDefault() { return MakeCommand(kMethodSetDefault); }

Command BuildSetMusic(bool enabled, const std::string& host, uint16_t port) {
  Command command = MakeCommand(kMethodSetMusic);
  if (enabled) {
    command.params.append(1);
    command.params.append(host);
    command.params.append(static_cast<Json::UInt>(port));
  } else {
    command.params.append(0);
  }
  return command;
}

Command BuildSetAdjust(AdjustAction action, AdjustProperty property) {
  Command command = MakeCommand(kMethodSetAdjust);
  command.params.append(AdjustActionName(action));
  command.params.append(AdjustPropertyName(property));
  return command;
}

Command BuildSetScene(const Scene& scene) {
  Command command = MakeCommand(kMethodSetScene);
  const int brightness = std::clamp(scene.brightness, 1, 100);
  switch (scene.kind) {
    case SceneKind::kColor:
      command.params.append("color");
      command.params.append(static_cast<Json::UInt>(scene.value & 0xffffff));
      command.params.append(brightness);
      break;
    case SceneKind::kHsv:
      command.params.append("hsv");
      command.params.append(std::clamp(scene.hue, 0, 359));
      command.params.append(std::clamp(scene.saturation, 0, 100));
      command.params.append(brightness);
      break;
    case SceneKind::kColorTemperature:
      command.params.append("ct");
      command.params.append(
          ClampColorTemperature(static_cast<int>(std::min<uint32_t>(scene.value, 100000))));
      command.params.append(brightness);
      break;
    case SceneKind::kFlow: {
      const Command flow = BuildStartFlow(scene.flow);
      if (flow.method.empty()) {
        return Command{};
      }
      command.params.append("cf");
      for (const auto& param : flow.params) {
        command.params.append(param);
      }
      break;
    }
    case SceneKind::kAutoDelayOff:
      command.params.append("auto_delay_off");
      command.params.append(brightness);
      command.params.append(std::max(scene.minutes, 1));
      break;
  }
  return command;
}

Command BuildGetProperties(const std::vector<std::string>& names) {
  Command command = MakeCommand(kMethodGetProp);
  for (const auto& name : names) {
    command.params.append(name);
  }
  return command;
}

}  // namespace yeelight
