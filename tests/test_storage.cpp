// Tests for snapshot persistence of devices and sync groups.
#include "yeelight/yeelight.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace {

yeelight::Device SampleDevice(const std::string& ip) {
  yeelight::Device device;
  device.ip = ip;
  device.port = 55443;
  device.id = 0x15243f;
  device.name = "desk";
  device.model = "color";
  device.firmware_version = "18";
  device.features = yeelight::FeatureSet::FromSupportList("set_power set_rgb set_ct_abx");
  device.state = yeelight::LightState::On(42, yeelight::Color::Rgb(0, 128, 255));
  device.last_seen = yeelight::Device::Clock::time_point(std::chrono::milliseconds(1700000000123));
  device.connectivity = yeelight::Connectivity::kReachable;
  return device;
}

yeelight::SyncGroup SampleGroup() {
  yeelight::SyncGroup group;
  group.id = "group-3";
  group.name = "hall";
  group.members = {"10.0.0.1:55443", "10.0.0.2:55443"};
  group.policy = yeelight::SyncPolicy::kAlternate;
  group.master = std::string("10.0.0.1:55443");
  return group;
}

std::string TempPath(const std::string& name) {
  const std::string path = ::testing::TempDir() + "yeelight_" + name + ".json";
  std::remove(path.c_str());
  return path;
}

}  // namespace

TEST(StorageTest, RegistrySnapshotRoundTripResetsConnectivity) {
  yeelight::Registry source;
  ASSERT_TRUE(source.Upsert(SampleDevice("192.168.1.10")));
  ASSERT_TRUE(source.Upsert(SampleDevice("192.168.1.11")));

  yeelight::MemoryKeyValueStore store;
  yeelight::Error error;
  ASSERT_TRUE(yeelight::SaveRegistrySnapshot(source, store, &error)) << error.ToString();

  yeelight::Registry restored;
  EXPECT_EQ(yeelight::LoadRegistrySnapshot(store, &restored, &error), 2u);
  EXPECT_TRUE(error.ok());

  const auto device = restored.Get("192.168.1.10:55443");
  ASSERT_TRUE(device.has_value());
  const auto expected = SampleDevice("192.168.1.10");
  EXPECT_EQ(device->id, expected.id);
  EXPECT_EQ(device->name, "desk");
  EXPECT_EQ(device->model, "color");
  EXPECT_EQ(device->firmware_version, expected.firmware_version);
  EXPECT_EQ(device->features.bits(), expected.features.bits());
  EXPECT_EQ(device->state, expected.state);
  EXPECT_EQ(device->last_seen, expected.last_seen);
  EXPECT_EQ(device->connectivity, yeelight::Connectivity::kUnknown);
}

TEST(StorageTest, DeviceJsonCarriesColorKind) {
  auto device = SampleDevice("192.168.1.12");
  device.state = yeelight::LightState::On(10, yeelight::Color::Temperature(2700));
  const Json::Value value = yeelight::DeviceToJson(device);
  EXPECT_EQ(value["state"]["color"]["kind"].asString(), "temperature");
  EXPECT_EQ(value["state"]["color"]["kelvin"].asInt(), 2700);

  yeelight::Device parsed;
  ASSERT_TRUE(yeelight::DeviceFromJson(value, &parsed));
  EXPECT_EQ(parsed.state, device.state);

  Json::Value broken = value;
  broken["port"] = "not a port";
  yeelight::Error error;
  EXPECT_FALSE(yeelight::DeviceFromJson(broken, &parsed, &error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kStorageError);
  EXPECT_NE(error.message.find("port"), std::string::npos);
}

TEST(StorageTest, SyncGroupsRoundTrip) {
  yeelight::MemoryKeyValueStore store;
  auto masterless = SampleGroup();
  masterless.id = "group-4";
  masterless.policy = yeelight::SyncPolicy::kSequence;
  masterless.master.reset();
  ASSERT_TRUE(yeelight::SaveSyncGroups({SampleGroup(), masterless}, store));

  std::vector<yeelight::SyncGroup> groups;
  yeelight::Error error;
  ASSERT_TRUE(yeelight::LoadSyncGroups(store, &groups, &error)) << error.ToString();
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].id, "group-3");
  EXPECT_EQ(groups[0].name, "hall");
  EXPECT_EQ(groups[0].members, SampleGroup().members);
  EXPECT_EQ(groups[0].policy, yeelight::SyncPolicy::kAlternate);
  EXPECT_EQ(groups[0].master, SampleGroup().master);
  EXPECT_FALSE(groups[1].master.has_value());
  EXPECT_EQ(groups[1].policy, yeelight::SyncPolicy::kSequence);
}

TEST(StorageTest, AbsentSnapshotsRestoreNothing) {
  yeelight::MemoryKeyValueStore store;
  yeelight::Registry registry;
  yeelight::Error error;
  EXPECT_EQ(yeelight::LoadRegistrySnapshot(store, &registry, &error), 0u);
  EXPECT_TRUE(error.ok());

  std::vector<yeelight::SyncGroup> groups{SampleGroup()};
  EXPECT_TRUE(yeelight::LoadSyncGroups(store, &groups, &error));
  EXPECT_TRUE(groups.empty());
}

TEST(StorageTest, InvalidEntriesAreSkipped) {
  yeelight::MemoryKeyValueStore store;
  Json::Value devices(Json::arrayValue);
  devices.append(yeelight::DeviceToJson(SampleDevice("192.168.1.10")));
  devices.append(Json::Value("garbage"));
  Json::Value missing_ip = yeelight::DeviceToJson(SampleDevice("192.168.1.11"));
  missing_ip.removeMember("ip");
  devices.append(missing_ip);
  // Wrong-typed fields.
  Json::Value array_name = yeelight::DeviceToJson(SampleDevice("192.168.1.12"));
  array_name["name"] = Json::Value(Json::arrayValue);
  array_name["name"].append(1);
  devices.append(array_name);
  Json::Value object_model = yeelight::DeviceToJson(SampleDevice("192.168.1.13"));
  object_model["model"] = Json::Value(Json::objectValue);
  devices.append(object_model);
  Json::Value array_power = yeelight::DeviceToJson(SampleDevice("192.168.1.14"));
  array_power["state"]["power"] = Json::Value(Json::arrayValue);
  devices.append(array_power);
  Json::Value numeric_kind = yeelight::DeviceToJson(SampleDevice("192.168.1.15"));
  numeric_kind["state"]["color"]["kind"] = 5;
  devices.append(numeric_kind);
  Json::Value string_state = yeelight::DeviceToJson(SampleDevice("192.168.1.16"));
  string_state["state"] = "on";
  devices.append(string_state);
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  ASSERT_TRUE(store.Set(yeelight::kDevicesKey, Json::writeString(builder, devices)));

  Json::Value groups_json(Json::arrayValue);
  groups_json.append(yeelight::GroupToJson(SampleGroup()));
  Json::Value array_policy = yeelight::GroupToJson(SampleGroup());
  array_policy["id"] = "group-8";
  array_policy["policy"] = Json::Value(Json::arrayValue);
  groups_json.append(array_policy);
  Json::Value numeric_name = yeelight::GroupToJson(SampleGroup());
  numeric_name["id"] = "group-9";
  numeric_name["name"] = 7;
  groups_json.append(numeric_name);
  ASSERT_TRUE(store.Set(yeelight::kSyncGroupsKey, Json::writeString(builder, groups_json)));

  yeelight::Registry registry;
  yeelight::Error error;
  EXPECT_EQ(yeelight::LoadRegistrySnapshot(store, &registry, &error), 1u);
  EXPECT_TRUE(error.ok()) << error.ToString();
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_TRUE(registry.Get("192.168.1.10:55443").has_value());

  std::vector<yeelight::SyncGroup> groups;
  ASSERT_TRUE(yeelight::LoadSyncGroups(store, &groups, &error)) << error.ToString();
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].id, SampleGroup().id);
}

TEST(StorageTest, WrongTypedNameIsRejected) {
  yeelight::MemoryKeyValueStore store;
  ASSERT_TRUE(
      store.Set(yeelight::kDevicesKey, "[{\"ip\":\"10.0.0.1\",\"port\":55443,\"name\":[1]}]"));
  yeelight::Registry registry;
  EXPECT_EQ(yeelight::LoadRegistrySnapshot(store, &registry), 0u);
  EXPECT_EQ(registry.size(), 0u);

  yeelight::Error error;
  Json::Value device(Json::objectValue);
  device["ip"] = "10.0.0.1";
  device["port"] = 55443;
  device["name"] = Json::Value(Json::arrayValue);
  EXPECT_FALSE(yeelight::DeviceFromJson(device, nullptr, &error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kStorageError);
  EXPECT_EQ(error.message, "invalid device field: name");
}

TEST(StorageTest, UndecodableSnapshotIsAnError) {
  yeelight::MemoryKeyValueStore store;
  ASSERT_TRUE(store.Set(yeelight::kDevicesKey, "{\"not\":\"an array\"}"));
  ASSERT_TRUE(store.Set(yeelight::kSyncGroupsKey, "[[["));

  yeelight::Registry registry;
  yeelight::Error error;
  EXPECT_EQ(yeelight::LoadRegistrySnapshot(store, &registry, &error), 0u);
  EXPECT_EQ(error.code, yeelight::ErrorCode::kStorageError);

  std::vector<yeelight::SyncGroup> groups;
  error = yeelight::Error();
  EXPECT_FALSE(yeelight::LoadSyncGroups(store, &groups, &error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kStorageError);
}

TEST(StorageTest, FileStorePersistsAcrossInstances) {
  const std::string path = TempPath("persist");
  {
    yeelight::FileKeyValueStore store(path);
    EXPECT_FALSE(store.Get("missing").has_value());
    yeelight::Error error;
    ASSERT_TRUE(store.Set("first", "1", &error)) << error.ToString();
    ASSERT_TRUE(store.Set("second", "two", &error)) << error.ToString();
  }
  yeelight::FileKeyValueStore reopened(path);
  EXPECT_EQ(reopened.Get("first"), std::optional<std::string>("1"));
  EXPECT_EQ(reopened.Get("second"), std::optional<std::string>("two"));

  yeelight::Registry registry;
  ASSERT_TRUE(registry.Upsert(SampleDevice("192.168.1.30")));
  ASSERT_TRUE(yeelight::SaveRegistrySnapshot(registry, reopened));
  yeelight::Registry restored;
  yeelight::FileKeyValueStore third(path);
  EXPECT_EQ(yeelight::LoadRegistrySnapshot(third, &restored), 1u);
  std::remove(path.c_str());
}

TEST(StorageTest, CorruptFileIsReported) {
  const std::string path = TempPath("corrupt");
  {
    std::ofstream out(path);
    out << "this is not json";
  }
  yeelight::FileKeyValueStore store(path);
  yeelight::Error error;
  EXPECT_FALSE(store.Get("anything", &error).has_value());
  EXPECT_EQ(error.code, yeelight::ErrorCode::kStorageError);
  EXPECT_FALSE(store.Set("key", "value", &error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kStorageError);

  yeelight::Registry registry;
  error = yeelight::Error();
  EXPECT_EQ(yeelight::LoadRegistrySnapshot(store, &registry, &error), 0u);
  EXPECT_EQ(error.code, yeelight::ErrorCode::kStorageError);
  std::remove(path.c_str());
}
