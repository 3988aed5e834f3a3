// Example: discover bulbs on the local network and print what they report.
#include "yeelight/yeelight.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  yeelight::ClientConfig config;
  config.discovery.window = std::chrono::milliseconds(3000);
  config.discovery.seed_state_from_reply = true;
  if (argc > 1) {
    config.discovery.multicast_interface = argv[1];
  }

  yeelight::Client client(config);
  yeelight::Error error;
  if (!client.Start(&error)) {
    std::cerr << "Failed to start client: " << error.ToString() << std::endl;
    return 1;
  }

  std::cout << "Searching for bulbs (3s)..." << std::endl;
  std::vector<yeelight::Device> devices;
  if (!client.Discover(&devices, &error)) {
    std::cerr << "Discovery failed: " << error.ToString() << std::endl;
    return 1;
  }

  std::cout << "Discovered devices: " << devices.size() << std::endl;
  for (const auto& device : devices) {
    std::cout << " - " << device.address() << " model=" << device.model
              << " id=0x" << std::hex << device.id << std::dec;
    if (!device.name.empty()) {
      std::cout << " name=" << device.name;
    }
    if (device.firmware_version) {
      std::cout << " fw=" << *device.firmware_version;
    }
    std::cout << " power=" << yeelight::PowerStateName(device.state.power);
    if (device.state.is_known()) {
      std::cout << " bright=" << +device.state.brightness;
    }
    std::cout << std::endl;
  }

  if (argc > 2) {
    yeelight::FileKeyValueStore store(argv[2]);
    if (!client.SaveSnapshot(store, &error)) {
      std::cerr << "Snapshot failed: " << error.ToString() << std::endl;
      return 1;
    }
    std::cout << "Snapshot written to " << argv[2] << std::endl;
  }
  client.Stop();
  return 0;
}
