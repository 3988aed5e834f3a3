#include "yeelight/storage.h"

#include "yeelight/registry.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>

namespace yeelight {
namespace {

std::string WriteCompact(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

bool ParseJson(const std::string& text, Json::Value* out, std::string* reason) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), out, reason);
}

// Absent or null keys yield `fallback`; any other non-string is rejected.
bool OptionalString(const Json::Value& object, const char* key, const std::string& fallback,
                    std::string* out) {
  const Json::Value& value = object[key];
  if (value.isNull()) {
    *out = fallback;
    return true;
  }
  if (!value.isString()) {
    return false;
  }
  *out = value.asString();
  return true;
}

const char* ColorKindName(Color::Kind kind) {
  switch (kind) {
    case Color::Kind::kRgb:
      return "rgb";
    case Color::Kind::kTemperature:
      return "temperature";
    case Color::Kind::kWhite:
      return "white";
  }
  return "white";
}

int64_t ToEpochMillis(Device::Clock::time_point time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch())
      .count();
}

Device::Clock::time_point FromEpochMillis(int64_t millis) {
  return Device::Clock::time_point(
      std::chrono::duration_cast<Device::Clock::duration>(std::chrono::milliseconds(millis)));
}

Json::Value StateToJson(const LightState& state) {
  Json::Value value(Json::objectValue);
  value["power"] = PowerStateName(state.power);
  if (state.brightness_known) {
    value["brightness"] = static_cast<int>(state.brightness);
  }
  if (state.color_known) {
    Json::Value color(Json::objectValue);
    color["kind"] = ColorKindName(state.color.kind);
    if (state.color.kind == Color::Kind::kRgb) {
      color["rgb"] = static_cast<Json::UInt>(state.color.packed_rgb());
    } else if (state.color.kind == Color::Kind::kTemperature) {
      color["kelvin"] = static_cast<int>(state.color.kelvin);
    }
    value["color"] = color;
  }
  return value;
}

bool StateFromJson(const Json::Value& value, LightState* out) {
  if (!value.isObject()) {
    return false;
  }
  LightState state;
  std::string power;
  if (!OptionalString(value, "power", "unknown", &power)) {
    return false;
  }
  if (power == "on") {
    state.power = PowerState::kOn;
  } else if (power == "off") {
    state.power = PowerState::kOff;
  } else if (power != "unknown") {
    return false;
  }
  const Json::Value& brightness = value["brightness"];
  if (!brightness.isNull()) {
    if (!brightness.isInt()) {
      return false;
    }
    state.SetBrightness(brightness.asInt());
  }
  const Json::Value& color = value["color"];
  if (!color.isNull()) {
    if (!color.isObject()) {
      return false;
    }
    std::string kind;
    if (!OptionalString(color, "kind", "white", &kind)) {
      return false;
    }
    if (kind == "rgb") {
      if (!color["rgb"].isUInt()) {
        return false;
      }
      state.SetColor(Color::FromPackedRgb(color["rgb"].asUInt()));
    } else if (kind == "temperature") {
      if (!color["kelvin"].isInt()) {
        return false;
      }
      state.SetColor(Color::Temperature(color["kelvin"].asInt()));
    } else if (kind == "white") {
      state.SetColor(Color::White());
    } else {
      return false;
    }
  }
  *out = state;
  return true;
}

}  // namespace

std::optional<std::string> MemoryKeyValueStore::Get(const std::string& key, Error* error) {
  (void)error;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryKeyValueStore::Set(const std::string& key, const std::string& value,
                              Error* error) {
  (void)error;
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
  return true;
}

FileKeyValueStore::FileKeyValueStore(std::string path) : path_(std::move(path)) {}

bool FileKeyValueStore::Load(Json::Value* root, Error* error) {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    if (errno == ENOENT) {
      *root = Json::Value(Json::objectValue);
      return true;
    }
    return SetError(error, ErrorCode::kStorageError,
                    "open " + path_ + " failed: " + std::strerror(errno));
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  const std::string text = contents.str();
  if (text.empty()) {
    *root = Json::Value(Json::objectValue);
    return true;
  }
  std::string reason;
  if (!ParseJson(text, root, &reason) || !root->isObject()) {
    return SetError(error, ErrorCode::kStorageError,
                    path_ + " is not a JSON object" + (reason.empty() ? "" : ": " + reason));
  }
  return true;
}

std::optional<std::string> FileKeyValueStore::Get(const std::string& key, Error* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  Json::Value root;
  if (!Load(&root, error)) {
    return std::nullopt;
  }
  const Json::Value& value = root[key];
  if (!value.isString()) {
    return std::nullopt;
  }
  return value.asString();
}

bool FileKeyValueStore::Set(const std::string& key, const std::string& value, Error* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  Json::Value root;
  if (!Load(&root, error)) {
    return false;
  }
  root[key] = value;

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return SetError(error, ErrorCode::kStorageError,
                      "open " + tmp_path + " failed: " + std::strerror(errno));
    }
    out << Json::writeString(builder, root) << '\n';
    out.flush();
    if (!out) {
      return SetError(error, ErrorCode::kStorageError, "write " + tmp_path + " failed");
    }
  }
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    const std::string message = "rename " + tmp_path + " failed: " + std::strerror(errno);
    std::remove(tmp_path.c_str());
    return SetError(error, ErrorCode::kStorageError, message);
  }
  return true;
}

Json::Value DeviceToJson(const Device& device) {
  Json::Value value(Json::objectValue);
  value["ip"] = device.ip;
  value["port"] = static_cast<Json::UInt>(device.port);
  value["id"] = static_cast<Json::UInt64>(device.id);
  value["name"] = device.name;
  value["model"] = device.model;
  if (device.firmware_version) {
    value["firmware_version"] = *device.firmware_version;
  }
  value["features"] = static_cast<Json::UInt>(device.features.bits());
  value["state"] = StateToJson(device.state);
  value["last_seen_ms"] = static_cast<Json::Int64>(ToEpochMillis(device.last_seen));
  return value;
}

bool DeviceFromJson(const Json::Value& value, Device* out, Error* error) {
  auto fail = [&](const std::string& field) {
    return SetError(error, ErrorCode::kStorageError, "invalid device field: " + field);
  };
  if (!value.isObject()) {
    return SetError(error, ErrorCode::kStorageError, "device is not an object");
  }
  Device device;
  if (!value["ip"].isString() || value["ip"].asString().empty()) {
    return fail("ip");
  }
  device.ip = value["ip"].asString();
  const Json::Value& port = value["port"];
  if (!port.isUInt() || port.asUInt() == 0 || port.asUInt() > 65535) {
    return fail("port");
  }
  device.port = static_cast<uint16_t>(port.asUInt());
  if (value.isMember("id")) {
    if (!value["id"].isUInt64()) {
      return fail("id");
    }
    device.id = value["id"].asUInt64();
  }
  if (!OptionalString(value, "name", "", &device.name)) {
    return fail("name");
  }
  if (!OptionalString(value, "model", "", &device.model)) {
    return fail("model");
  }
  const Json::Value& firmware = value["firmware_version"];
  if (!firmware.isNull()) {
    if (!firmware.isString()) {
      return fail("firmware_version");
    }
    device.firmware_version = firmware.asString();
  }
  if (value.isMember("features")) {
    if (!value["features"].isUInt() || value["features"].asUInt() > 0xff) {
      return fail("features");
    }
    device.features = FeatureSet::FromBits(static_cast<uint8_t>(value["features"].asUInt()));
  }
  if (value.isMember("state") && !StateFromJson(value["state"], &device.state)) {
    return fail("state");
  }
  if (value.isMember("last_seen_ms")) {
    if (!value["last_seen_ms"].isInt64()) {
      return fail("last_seen_ms");
    }
    device.last_seen = FromEpochMillis(value["last_seen_ms"].asInt64());
  }
  if (out) {
    *out = device;
  }
  return true;
}

Json::Value GroupToJson(const SyncGroup& group) {
  Json::Value value(Json::objectValue);
  value["id"] = group.id;
  value["name"] = group.name;
  Json::Value members(Json::arrayValue);
  for (const auto& member : group.members) {
    members.append(member);
  }
  value["members"] = members;
  value["policy"] = SyncPolicyName(group.policy);
  if (group.master) {
    value["master"] = *group.master;
  }
  return value;
}

bool GroupFromJson(const Json::Value& value, SyncGroup* out, Error* error) {
  auto fail = [&](const std::string& field) {
    return SetError(error, ErrorCode::kStorageError, "invalid group field: " + field);
  };
  if (!value.isObject()) {
    return SetError(error, ErrorCode::kStorageError, "group is not an object");
  }
  SyncGroup group;
  if (!value["id"].isString()) {
    return fail("id");
  }
  group.id = value["id"].asString();
  if (!OptionalString(value, "name", "", &group.name)) {
    return fail("name");
  }
  const Json::Value& members = value["members"];
  if (!members.isArray()) {
    return fail("members");
  }
  for (Json::ArrayIndex i = 0; i < members.size(); ++i) {
    if (!members[i].isString()) {
      return fail("members");
    }
    group.members.push_back(members[i].asString());
  }
  std::string policy;
  if (!OptionalString(value, "policy", "mirror", &policy) ||
      !ParseSyncPolicy(policy, &group.policy)) {
    return fail("policy");
  }
  if (value.isMember("master")) {
    if (!value["master"].isString()) {
      return fail("master");
    }
    group.master = value["master"].asString();
  }
  if (out) {
    *out = group;
  }
  return true;
}

bool SaveRegistrySnapshot(const Registry& registry, KeyValueStore& store, Error* error) {
  Json::Value devices(Json::arrayValue);
  for (const auto& device : registry.All()) {
    devices.append(DeviceToJson(device));
  }
  return store.Set(kDevicesKey, WriteCompact(devices), error);
}

size_t LoadRegistrySnapshot(KeyValueStore& store, Registry* registry, Error* error) {
  if (registry == nullptr) {
    SetError(error, ErrorCode::kInvalidArgument, "registry is null");
    return 0;
  }
  Error read_error;
  const std::optional<std::string> text = store.Get(kDevicesKey, &read_error);
  if (!text) {
    if (!read_error.ok()) {
      SetError(error, read_error.code, read_error.message);
    }
    return 0;
  }
  Json::Value devices;
  std::string reason;
  if (!ParseJson(*text, &devices, &reason) || !devices.isArray()) {
    SetError(error, ErrorCode::kStorageError, "device snapshot is not a JSON array");
    return 0;
  }
  size_t restored = 0;
  for (Json::ArrayIndex i = 0; i < devices.size(); ++i) {
    Device device;
    if (!DeviceFromJson(devices[i], &device)) {
      continue;
    }
    device.connectivity = Connectivity::kUnknown;
    if (registry->Upsert(device)) {
      ++restored;
    }
  }
  return restored;
}

bool SaveSyncGroups(const std::vector<SyncGroup>& groups, KeyValueStore& store,
                    Error* error) {
  Json::Value array(Json::arrayValue);
  for (const auto& group : groups) {
    array.append(GroupToJson(group));
  }
  return store.Set(kSyncGroupsKey, WriteCompact(array), error);
}

bool LoadSyncGroups(KeyValueStore& store, std::vector<SyncGroup>* groups, Error* error) {
  if (groups == nullptr) {
    return SetError(error, ErrorCode::kInvalidArgument, "groups is null");
  }
  groups->clear();
  Error read_error;
  const std::optional<std::string> text = store.Get(kSyncGroupsKey, &read_error);
  if (!text) {
    if (!read_error.ok()) {
      return SetError(error, read_error.code, read_error.message);
    }
    return true;
  }
  Json::Value array;
  std::string reason;
  if (!ParseJson(*text, &array, &reason) || !array.isArray()) {
    return SetError(error, ErrorCode::kStorageError, "group snapshot is not a JSON array");
  }
  for (Json::ArrayIndex i = 0; i < array.size(); ++i) {
    SyncGroup group;
    if (GroupFromJson(array[i], &group)) {
      groups->push_back(std::move(group));
    }
  }
  return true;
}

}  // namespace yeelight
