// Example: keep a group of bulbs in step with a master bulb.
#include "yeelight/yeelight.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: group_sync <mirror|alternate|sequence|random> <master> <member>..."
              << std::endl;
    return 1;
  }
  yeelight::SyncGroup group;
  group.name = "example";
  if (!yeelight::ParseSyncPolicy(argv[1], &group.policy)) {
    std::cerr << "Unknown policy: " << argv[1] << std::endl;
    return 1;
  }
  std::vector<yeelight::Device> devices;
  for (int i = 2; i < argc; ++i) {
    yeelight::Device device;
    if (!yeelight::SplitAddress(argv[i], &device.ip, &device.port)) {
      std::cerr << "Invalid address: " << argv[i] << std::endl;
      return 1;
    }
    group.members.push_back(device.address());
    devices.push_back(device);
  }
  group.master = group.members.front();

  yeelight::Client client;
  yeelight::Error error;
  if (!client.Start(&error)) {
    std::cerr << "Failed to start client: " << error.ToString() << std::endl;
    return 1;
  }
  for (const auto& device : devices) {
    client.registry().Upsert(device);
    if (client.OpenSession(device.address(), &error) == nullptr) {
      std::cerr << "Failed to connect " << device.address() << ": " << error.ToString()
                << std::endl;
    }
  }

  std::string id;
  if (!client.CreateGroup(group, &id, &error)) {
    std::cerr << "Invalid group: " << error.ToString() << std::endl;
    return 1;
  }
  client.coordinator().SetFailureCallback([](const yeelight::SyncFailure& failure) {
    std::cerr << "sync " << failure.group_id << " -> " << failure.member << ": "
              << failure.error.ToString() << std::endl;
  });
  const std::string master = *group.master;
  client.Subscribe([master](const yeelight::StateChangeEvent& event) {
    if (event.address != master) {
      return;
    }
    std::cout << "master " << event.address << " now "
              << yeelight::PowerStateName(event.current.power) << std::endl;
  });

  std::cout << "Group " << id << " (" << yeelight::SyncPolicyName(group.policy)
            << ") follows " << *group.master
            << ". Change the master from its app; press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);

  const auto metrics = client.coordinator().GetMetrics();
  std::cout << "propagations=" << metrics.propagations
            << " commands=" << metrics.commands_sent
            << " failures=" << metrics.command_failures << std::endl;
  client.Stop();
  return 0;
}
