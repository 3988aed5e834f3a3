// Example: open a control session to one bulb and run through its commands.
#include "yeelight/yeelight.h"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

void Report(const char* what, const yeelight::CommandResult& result) {
  if (result.ok()) {
    std::cout << what << ": ok" << std::endl;
  } else {
    std::cout << what << ": " << result.error.ToString() << std::endl;
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: control_demo <ip[:port]>" << std::endl;
    return 1;
  }
  yeelight::Device device;
  if (!yeelight::SplitAddress(argv[1], &device.ip, &device.port)) {
    std::cerr << "Invalid address: " << argv[1] << std::endl;
    return 1;
  }

  yeelight::Registry registry;
  yeelight::EventHub events;
  registry.Upsert(device);
  events.Subscribe([](const yeelight::StateChangeEvent& event) {
    std::cout << "state " << event.address << ": power="
              << yeelight::PowerStateName(event.current.power)
              << " bright=" << +event.current.brightness;
    for (const auto& property : event.properties) {
      std::cout << " " << property.first << "=" << property.second;
    }
    std::cout << std::endl;
  });

  yeelight::ControlSession session(device, yeelight::SessionConfig(), &registry, &events);
  session.SetDisconnectCallback([](const std::string& address, const yeelight::Error& error) {
    std::cerr << "Lost " << address << ": " << error.ToString() << std::endl;
  });

  yeelight::Supervisor supervisor;
  yeelight::Error error;
  if (!supervisor.OpenSession(session, &error)) {
    std::cerr << "Failed to connect: " << error.ToString() << std::endl;
    return 1;
  }
  if (!session.RefreshState(&error)) {
    std::cerr << "Failed to read state: " << error.ToString() << std::endl;
  }

  const auto smooth = yeelight::Transition::Smooth(500);
  Report("power on", session.SetPower(true, smooth));
  Report("brightness 80", session.SetBrightness(80, smooth));
  std::this_thread::sleep_for(std::chrono::seconds(1));
  Report("rgb red", session.SetRgb(255, 0, 0, smooth));
  std::this_thread::sleep_for(std::chrono::seconds(1));
  Report("ct 2700", session.SetColorTemperature(2700, smooth));
  std::this_thread::sleep_for(std::chrono::seconds(1));

  yeelight::Flow flow;
  flow.repeat = true;
  flow.transitions.push_back({1000, yeelight::FlowMode::kColor, 0xff0000, 100});
  flow.transitions.push_back({1000, yeelight::FlowMode::kColor, 0x0000ff, 100});
  flow.transitions.push_back({500, yeelight::FlowMode::kSleep, 0, -1});
  Report("start flow", session.StartFlow(flow));

  std::cout << "Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  Report("stop flow", session.StopFlow());
  Report("toggle", session.Toggle());
  session.Close();

  const auto metrics = session.GetMetrics();
  std::cout << "commands=" << metrics.commands_sent
            << " responses=" << metrics.responses_received << std::endl;
  return 0;
}
