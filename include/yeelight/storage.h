#pragma once

#include "yeelight/device.h"
#include "yeelight/error.h"
#include "yeelight/sync_coordinator.h"

#include <json/json.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace yeelight {

class Registry;

/// Storage keys of the persisted snapshots.
constexpr const char kDevicesKey[] = "yeelight.devices";
constexpr const char kSyncGroupsKey[] = "yeelight.sync_groups";

/**
 * String key-value collaborator used for snapshots.
 */
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  /// Returns nullopt when the key is absent or the store could not be read
  /// (the latter also fills `error`).
  virtual std::optional<std::string> Get(const std::string& key,
                                         Error* error = nullptr) = 0;
  virtual bool Set(const std::string& key, const std::string& value,
                   Error* error = nullptr) = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
 public:
  std::optional<std::string> Get(const std::string& key, Error* error = nullptr) override;
  bool Set(const std::string& key, const std::string& value, Error* error = nullptr) override;

 private:
  std::mutex mutex_;
  std::map<std::string, std::string> values_;
};

/**
 * Keeps all keys in one JSON object file, rewritten on every Set().
 */
class FileKeyValueStore : public KeyValueStore {
 public:
  explicit FileKeyValueStore(std::string path);

  std::optional<std::string> Get(const std::string& key, Error* error = nullptr) override;
  bool Set(const std::string& key, const std::string& value, Error* error = nullptr) override;

  const std::string& path() const { return path_; }

 private:
  bool Load(Json::Value* root, Error* error);

  std::string path_;
  std::mutex mutex_;
};

Json::Value DeviceToJson(const Device& device);
bool DeviceFromJson(const Json::Value& value, Device* out, Error* error = nullptr);
Json::Value GroupToJson(const SyncGroup& group);
bool GroupFromJson(const Json::Value& value, SyncGroup* out, Error* error = nullptr);

/// Persist every registry entry (metadata and last-known state).
bool SaveRegistrySnapshot(const Registry& registry, KeyValueStore& store,
                          Error* error = nullptr);
/// Restore devices into the registry with connectivity reset to kUnknown.
/// Returns the number of devices restored; an absent snapshot restores none.
size_t LoadRegistrySnapshot(KeyValueStore& store, Registry* registry,
                            Error* error = nullptr);

bool SaveSyncGroups(const std::vector<SyncGroup>& groups, KeyValueStore& store,
                    Error* error = nullptr);
/// Returns false only when a stored snapshot cannot be decoded.
bool LoadSyncGroups(KeyValueStore& store, std::vector<SyncGroup>* groups,
                    Error* error = nullptr);

}  // namespace yeelight
