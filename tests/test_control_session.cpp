// Tests for the control session against a loopback bulb.
#include "yeelight/test_hooks.h"

#include "fake_bulb.h"

#include <gtest/gtest.h>

#include <set>
#include <thread>

using yeelight_test::FakeBulb;
using yeelight_test::WaitUntil;

namespace {

yeelight::Device LoopbackDevice(uint16_t port) {
  yeelight::Device device;
  device.ip = "127.0.0.1";
  device.port = port;
  device.model = "color";
  return device;
}

yeelight::SessionConfig TestSessionConfig() {
  yeelight::SessionConfig config;
  config.connect_timeout = std::chrono::milliseconds(1000);
  config.response_timeout = std::chrono::milliseconds(1000);
  config.keepalive_interval = std::chrono::milliseconds(0);
  config.log_callback = [](const std::string&) {};
  return config;
}

}  // namespace

TEST(ControlSessionTest, SendsCommandAndCorrelatesResponse) {
  FakeBulb bulb;
  yeelight::ControlSession session(LoopbackDevice(bulb.port()), TestSessionConfig());
  yeelight::Error error;
  ASSERT_TRUE(session.Open(&error)) << error.ToString();
  EXPECT_EQ(session.state(), yeelight::SessionState::kReady);

  const auto result = session.SetPower(true, yeelight::Transition::Smooth(500));
  ASSERT_TRUE(result.ok()) << result.error.ToString();
  ASSERT_EQ(result.result.size(), 1u);
  EXPECT_EQ(result.result[0].asString(), "ok");

  const auto requests = bulb.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0]["id"].asUInt(), 1u);
  EXPECT_EQ(requests[0]["method"].asString(), "set_power");
  EXPECT_EQ(requests[0]["params"][0].asString(), "on");
  EXPECT_EQ(requests[0]["params"][1].asString(), "smooth");
  EXPECT_EQ(requests[0]["params"][2].asInt(), 500);

  const auto metrics = session.GetMetrics();
  EXPECT_EQ(metrics.commands_sent, 1u);
  EXPECT_EQ(metrics.responses_received, 1u);
}

TEST(ControlSessionTest, ThousandRequestIdsRoundTripWithoutCollisions) {
  FakeBulb bulb;
  yeelight::ControlSession session(LoopbackDevice(bulb.port()), TestSessionConfig());
  ASSERT_TRUE(session.Open());

  for (int i = 0; i < 1000; ++i) {
    const auto result = session.SetBrightness(1 + (i % 100));
    ASSERT_TRUE(result.ok()) << "request " << i << ": " << result.error.ToString();
  }

  std::set<uint32_t> ids;
  for (const auto& request : bulb.requests()) {
    ids.insert(request["id"].asUInt());
  }
  EXPECT_EQ(ids.size(), 1000u);
  EXPECT_EQ(*ids.begin(), 1u);
  EXPECT_EQ(*ids.rbegin(), 1000u);
  EXPECT_EQ(yeelight::test::GetPendingCount(session), 0u);
  EXPECT_EQ(yeelight::test::PeekNextRequestId(session), 1001u);
}

TEST(ControlSessionTest, OutOfOrderResponsesReachTheirCallers) {
  FakeBulb bulb;
  std::mutex held_mutex;
  std::vector<Json::Value> held;
  bulb.SetResponder([&](const Json::Value& request) {
    std::lock_guard<std::mutex> lock(held_mutex);
    held.push_back(request);
    if (held.size() < 2) {
      return std::vector<std::string>{};
    }
    // Answer the second request first; each result echoes its method.
    std::vector<std::string> replies;
    for (auto it = held.rbegin(); it != held.rend(); ++it) {
      Json::Value response(Json::objectValue);
      response["id"] = (*it)["id"];
      response["result"].append((*it)["method"].asString());
      replies.push_back(yeelight_test::ToLine(response));
    }
    held.clear();
    return replies;
  });

  yeelight::ControlSession session(LoopbackDevice(bulb.port()), TestSessionConfig());
  ASSERT_TRUE(session.Open());

  yeelight::CommandResult toggle_result;
  yeelight::CommandResult name_result;
  std::thread first([&]() { toggle_result = session.Toggle(); });
  ASSERT_TRUE(WaitUntil([&]() { return bulb.request_count() == 1; }));
  std::thread second([&]() { name_result = session.SetName("desk"); });
  first.join();
  second.join();

  ASSERT_TRUE(toggle_result.ok());
  ASSERT_TRUE(name_result.ok());
  EXPECT_EQ(toggle_result.result[0].asString(), "toggle");
  EXPECT_EQ(name_result.result[0].asString(), "set_name");
}

TEST(ControlSessionTest, TimeoutRemovesPendingRequest) {
  FakeBulb bulb;
  bulb.SetResponder([](const Json::Value&) { return std::vector<std::string>{}; });
  auto config = TestSessionConfig();
  config.response_timeout = std::chrono::milliseconds(150);
  yeelight::ControlSession session(LoopbackDevice(bulb.port()), config);
  ASSERT_TRUE(session.Open());

  const auto result = session.Toggle();
  EXPECT_EQ(result.error.code, yeelight::ErrorCode::kTimeout);
  EXPECT_EQ(yeelight::test::GetPendingCount(session), 0u);
  EXPECT_EQ(session.GetMetrics().timeouts, 1u);

  // A late answer for the expired id is dropped and counted.
  yeelight::test::InjectLine(session, "{\"id\":1,\"result\":[\"ok\"]}");
  EXPECT_EQ(session.GetMetrics().unknown_responses, 1u);
  EXPECT_EQ(session.state(), yeelight::SessionState::kReady);
}

TEST(ControlSessionTest, ErrorResponseMapsToDeviceError) {
  FakeBulb bulb;
  bulb.SetResponder([](const Json::Value& request) {
    return std::vector<std::string>{
        yeelight_test::ErrorResponse(request, -5000, "general error")};
  });
  yeelight::ControlSession session(LoopbackDevice(bulb.port()), TestSessionConfig());
  ASSERT_TRUE(session.Open());

  const auto result = session.SetRgb(255, 0, 0);
  EXPECT_EQ(result.error.code, yeelight::ErrorCode::kDeviceError);
  EXPECT_NE(result.error.message.find("general error"), std::string::npos);
  EXPECT_EQ(result.error.category(), yeelight::ErrorCategory::kCommand);
}

TEST(ControlSessionTest, StopFlowIsIdempotent) {
  FakeBulb bulb;
  bulb.SetResponder([](const Json::Value& request) {
    // Bulbs reject stop_cf when no flow is running.
    return std::vector<std::string>{
        yeelight_test::ErrorResponse(request, -1, "no flow running")};
  });
  yeelight::ControlSession session(LoopbackDevice(bulb.port()), TestSessionConfig());
  ASSERT_TRUE(session.Open());

  EXPECT_TRUE(session.StopFlow().ok());
  EXPECT_TRUE(session.StopFlow().ok());
  EXPECT_EQ(bulb.methods(), (std::vector<std::string>{"stop_cf", "stop_cf"}));
}

TEST(ControlSessionTest, SeveredTransportFailsPendingWithConnectionLost) {
  FakeBulb bulb;
  bulb.SetResponder([](const Json::Value&) { return std::vector<std::string>{}; });
  yeelight::Registry registry;
  yeelight::Device device = LoopbackDevice(bulb.port());
  device.last_seen = yeelight::Device::Clock::now();
  ASSERT_TRUE(registry.Upsert(device));

  auto config = TestSessionConfig();
  config.response_timeout = std::chrono::milliseconds(5000);
  yeelight::ControlSession session(device, config, &registry);
  std::atomic<int> disconnects{0};
  session.SetDisconnectCallback([&](const std::string& address, const yeelight::Error& error) {
    EXPECT_EQ(address, bulb.address());
    EXPECT_EQ(error.code, yeelight::ErrorCode::kConnectionLost);
    disconnects.fetch_add(1);
  });
  ASSERT_TRUE(session.Open());

  yeelight::CommandResult result;
  std::thread sender([&]() { result = session.SetBrightness(50); });
  ASSERT_TRUE(WaitUntil([&]() { return bulb.request_count() == 1; }));
  bulb.DropClient();
  sender.join();

  EXPECT_EQ(result.error.code, yeelight::ErrorCode::kConnectionLost);
  EXPECT_TRUE(WaitUntil([&]() { return disconnects.load() == 1; }));
  EXPECT_EQ(session.state(), yeelight::SessionState::kDisconnected);
  EXPECT_EQ(yeelight::test::GetPendingCount(session), 0u);
  auto stored = registry.Get(bulb.address());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->connectivity, yeelight::Connectivity::kUnreachable);

  // No reconnect happens on its own; sending now fails fast.
  EXPECT_EQ(session.Toggle().error.code, yeelight::ErrorCode::kNotConnected);
  EXPECT_EQ(bulb.connections(), 1u);
}

TEST(ControlSessionTest, ReopensAfterTransportFailure) {
  FakeBulb bulb;
  yeelight::ControlSession session(LoopbackDevice(bulb.port()), TestSessionConfig());
  ASSERT_TRUE(session.Open());
  ASSERT_TRUE(WaitUntil([&]() { return bulb.connected(); }));
  bulb.DropClient();
  ASSERT_TRUE(WaitUntil(
      [&]() { return session.state() == yeelight::SessionState::kDisconnected; }));

  yeelight::Error error;
  ASSERT_TRUE(session.Open(&error)) << error.ToString();
  EXPECT_TRUE(session.Toggle().ok());
  EXPECT_EQ(bulb.connections(), 2u);
}

TEST(ControlSessionTest, PropsPushUpdatesRegistryAndPublishesEvent) {
  FakeBulb bulb;
  yeelight::Registry registry;
  yeelight::EventHub events;
  yeelight::Device device = LoopbackDevice(bulb.port());
  device.last_seen = yeelight::Device::Clock::now();
  ASSERT_TRUE(registry.Upsert(device));

  std::mutex event_mutex;
  std::vector<yeelight::StateChangeEvent> received;
  events.Subscribe([&](const yeelight::StateChangeEvent& event) {
    std::lock_guard<std::mutex> lock(event_mutex);
    received.push_back(event);
  });

  yeelight::ControlSession session(device, TestSessionConfig(), &registry, &events);
  ASSERT_TRUE(session.Open());
  ASSERT_TRUE(WaitUntil([&]() { return bulb.connected(); }));
  bulb.Push(
      "{\"method\":\"props\",\"params\":{\"power\":\"on\",\"bright\":\"40\","
      "\"color_mode\":2,\"ct\":3000}}\r\n");

  ASSERT_TRUE(WaitUntil([&]() {
    std::lock_guard<std::mutex> lock(event_mutex);
    return !received.empty();
  }));
  {
    std::lock_guard<std::mutex> lock(event_mutex);
    EXPECT_EQ(received[0].address, bulb.address());
    EXPECT_FALSE(received[0].previous.is_known());
    EXPECT_TRUE(received[0].current.is_on());
    EXPECT_EQ(received[0].current.brightness, 40);
    EXPECT_EQ(received[0].current.color, yeelight::Color::Temperature(3000));
    EXPECT_EQ(received[0].properties.at("bright"), "40");
  }
  auto stored = registry.Get(bulb.address());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->state, yeelight::LightState::On(40, yeelight::Color::Temperature(3000)));
  EXPECT_EQ(session.GetMetrics().notifications_received, 1u);
}

TEST(ControlSessionTest, RefreshStatePublishesQueriedProperties) {
  FakeBulb bulb;
  bulb.SetResponder([](const Json::Value& request) {
    Json::Value response(Json::objectValue);
    response["id"] = request["id"];
    // power, bright, color_mode, ct, rgb, hue, sat, name
    for (const char* value : {"on", "75", "1", "4000", "16711680", "", "", "den"}) {
      response["result"].append(value);
    }
    return std::vector<std::string>{yeelight_test::ToLine(response)};
  });
  yeelight::Registry registry;
  yeelight::ControlSession session(LoopbackDevice(bulb.port()), TestSessionConfig(),
                                   &registry);
  ASSERT_TRUE(session.Open());

  yeelight::Error error;
  ASSERT_TRUE(session.RefreshState(&error)) << error.ToString();
  EXPECT_EQ(session.device().state, yeelight::LightState::On(75, yeelight::Color::Rgb(255, 0, 0)));
  EXPECT_EQ(session.device().name, "den");
  ASSERT_TRUE(registry.Get(bulb.address()).has_value());
  EXPECT_EQ(registry.Get(bulb.address())->state.brightness, 75);
}

TEST(ControlSessionTest, OpenWhileReadyFailsWithInvalidState) {
  FakeBulb bulb;
  yeelight::ControlSession session(LoopbackDevice(bulb.port()), TestSessionConfig());
  ASSERT_TRUE(session.Open());
  yeelight::Error error;
  EXPECT_FALSE(session.Open(&error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kInvalidState);
  session.Close();
  EXPECT_EQ(session.state(), yeelight::SessionState::kDisconnected);
}

TEST(ControlSessionTest, ConnectToClosedPortIsRefused) {
  uint16_t port = 0;
  {
    FakeBulb bulb;
    port = bulb.port();
  }
  yeelight::ControlSession session(LoopbackDevice(port), TestSessionConfig());
  yeelight::Error error;
  EXPECT_FALSE(session.Open(&error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kConnectionRefused);
  EXPECT_EQ(session.state(), yeelight::SessionState::kDisconnected);
}

TEST(ControlSessionTest, SendWithoutConnectionFails) {
  yeelight::ControlSession session(LoopbackDevice(55443), TestSessionConfig());
  EXPECT_EQ(session.Toggle().error.code, yeelight::ErrorCode::kNotConnected);
  EXPECT_EQ(session.StartFlow(yeelight::Flow()).error.code,
            yeelight::ErrorCode::kInvalidArgument);
  EXPECT_EQ(session.GetProperties({}).error.code, yeelight::ErrorCode::kInvalidArgument);
}

TEST(ControlSessionTest, MalformedLinesAreDroppedAndCounted) {
  yeelight::ControlSession session(LoopbackDevice(55443), TestSessionConfig());
  yeelight::test::InjectLine(session, "not json");
  yeelight::test::InjectLine(session, "[1,2,3]");
  yeelight::test::InjectLine(session, "{\"id\":4}");
  EXPECT_EQ(session.GetMetrics().parse_errors, 3u);
  EXPECT_EQ(session.GetMetrics().unknown_responses, 0u);
}

TEST(ControlSessionTest, InvalidConfigRejectedOnOpen) {
  auto config = TestSessionConfig();
  config.response_timeout = std::chrono::milliseconds(0);
  yeelight::ControlSession session(LoopbackDevice(55443), config);
  yeelight::Error error;
  EXPECT_FALSE(session.Open(&error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kInvalidConfig);
}
