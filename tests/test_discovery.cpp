// Tests for the discovery engine with in-process probes and a loopback responder.
#include "yeelight/test_hooks.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

std::string SsdpReply(const std::string& ip, const std::string& id, const std::string& model) {
  return "HTTP/1.1 200 OK\r\n"
         "Cache-Control: max-age=3600\r\n"
         "Location: yeelight://" + ip + ":55443\r\n"
         "Server: POSIX UPnP/1.0 YGLC/1\r\n"
         "id: " + id + "\r\n"
         "model: " + model + "\r\n"
         "fw_ver: 18\r\n"
         "support: get_prop set_default set_power toggle set_bright start_cf stop_cf "
         "set_scene cron_add cron_get cron_del set_ct_abx set_rgb\r\n"
         "power: on\r\n"
         "bright: 100\r\n"
         "color_mode: 2\r\n"
         "ct: 4000\r\n"
         "rgb: 16711680\r\n"
         "name: \r\n\r\n";
}

yeelight::DiscoveryResult ParsedReply(const std::string& ip) {
  yeelight::DiscoveryResult result;
  EXPECT_TRUE(yeelight::test::ParseSsdpResponse(SsdpReply(ip, "0x000000000015243f", "color"),
                                                &result));
  return result;
}

// Scripted probe: fails `failures` times, then reports `results`.
class FakeProbe : public yeelight::DiscoveryProbe {
 public:
  FakeProbe(std::vector<yeelight::DiscoveryResult> results, int failures = 0,
            bool wait_for_cancel = false)
      : results_(std::move(results)), failures_(failures), wait_for_cancel_(wait_for_cancel) {}

  const char* name() const override { return "fake"; }

  bool Run(std::chrono::milliseconds window, const yeelight::CancelToken* cancel,
           const ResultHandler& on_result, yeelight::Error* error) override {
    runs_.fetch_add(1);
    if (failures_ > 0) {
      --failures_;
      return yeelight::SetError(error, yeelight::ErrorCode::kSocketError, "bind failed");
    }
    for (const auto& result : results_) {
      on_result(result);
    }
    if (wait_for_cancel_) {
      yeelight::SleepFor(window, cancel);
    }
    return true;
  }

  int runs() const { return runs_.load(); }

 private:
  std::vector<yeelight::DiscoveryResult> results_;
  int failures_;
  bool wait_for_cancel_;
  std::atomic<int> runs_{0};
};

yeelight::DiscoveryConfig FastConfig() {
  yeelight::DiscoveryConfig config;
  config.window = std::chrono::milliseconds(100);
  config.retry_delay = std::chrono::milliseconds(10);
  config.log_callback = [](const std::string&) {};
  return config;
}

}  // namespace

TEST(DiscoveryTest, TwoRepliesYieldTwoUnknownEntriesUntilFirstPush) {
  yeelight::Registry registry;
  yeelight::Discovery discovery(
      FastConfig(), &registry,
      std::unique_ptr<yeelight::DiscoveryProbe>(
          new FakeProbe({ParsedReply("192.168.1.10"), ParsedReply("192.168.1.11")})),
      nullptr);

  std::vector<yeelight::Device> devices;
  yeelight::Error error;
  ASSERT_TRUE(discovery.Discover(&devices, &error)) << error.ToString();
  ASSERT_EQ(devices.size(), 2u);
  ASSERT_EQ(registry.size(), 2u);
  for (const auto& device : registry.All()) {
    EXPECT_EQ(device.state.power, yeelight::PowerState::kUnknown);
    EXPECT_EQ(device.connectivity, yeelight::Connectivity::kReachable);
    EXPECT_EQ(device.model, "color");
    EXPECT_EQ(device.id, 0x15243fu);
  }

  // The first props push from a session is what fills in the state.
  yeelight::Device first = *registry.Get("192.168.1.10:55443");
  yeelight::ControlSession session(first, yeelight::SessionConfig(), &registry);
  yeelight::test::InjectLine(session,
                             "{\"method\":\"props\",\"params\":{\"power\":\"off\"}}");
  EXPECT_EQ(registry.Get("192.168.1.10:55443")->state.power, yeelight::PowerState::kOff);
  EXPECT_EQ(registry.Get("192.168.1.11:55443")->state.power, yeelight::PowerState::kUnknown);
}

TEST(DiscoveryTest, SeedsStateFromReplyWhenEnabled) {
  yeelight::Registry registry;
  auto config = FastConfig();
  config.seed_state_from_reply = true;
  yeelight::Discovery discovery(
      config, &registry,
      std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({ParsedReply("192.168.1.10")})),
      nullptr);

  ASSERT_TRUE(discovery.Discover(nullptr));
  auto stored = registry.Get("192.168.1.10:55443");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->state, yeelight::LightState::On(100, yeelight::Color::Temperature(4000)));
}

TEST(DiscoveryTest, ZeroRepliesIsEmptySuccess) {
  yeelight::Registry registry;
  yeelight::Discovery discovery(FastConfig(), &registry,
                                std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({})),
                                std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({})));
  std::vector<yeelight::Device> devices;
  yeelight::Error error;
  EXPECT_TRUE(discovery.Discover(&devices, &error));
  EXPECT_TRUE(error.ok());
  EXPECT_TRUE(devices.empty());
  EXPECT_EQ(registry.size(), 0u);
}

TEST(DiscoveryTest, DuplicateAnswersAcrossMechanismsCollapseByIp) {
  yeelight::DiscoveryResult mdns;
  mdns.ip = "192.168.1.10";
  mdns.port = 55443;
  mdns.payload = "yeelink-light-color1_miio1234._yeelight._tcp.local";
  mdns.source = yeelight::DiscoverySource::kMdns;

  yeelight::Registry registry;
  yeelight::Discovery discovery(
      FastConfig(), &registry,
      std::unique_ptr<yeelight::DiscoveryProbe>(
          new FakeProbe({ParsedReply("192.168.1.10"), ParsedReply("192.168.1.10")})),
      std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({mdns})));

  std::vector<yeelight::Device> devices;
  ASSERT_TRUE(discovery.Discover(&devices));
  EXPECT_EQ(devices.size(), 1u);
  EXPECT_EQ(registry.size(), 1u);
  const auto metrics = discovery.GetMetrics();
  EXPECT_EQ(metrics.results, 1u);
  EXPECT_EQ(metrics.duplicates, 2u);
}

TEST(DiscoveryTest, MdnsOnlyAnswerIsApplied) {
  yeelight::DiscoveryResult mdns;
  mdns.ip = "192.168.1.20";
  mdns.port = 55443;
  mdns.payload = "yeelink-light-ceiling4_miio99._yeelight._tcp.local";
  mdns.source = yeelight::DiscoverySource::kMdns;

  yeelight::Registry registry;
  yeelight::Discovery discovery(
      FastConfig(), &registry, std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({})),
      std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({mdns})));
  ASSERT_TRUE(discovery.Discover(nullptr));
  auto stored = registry.Get("192.168.1.20:55443");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->model, "ceiling4");
  EXPECT_TRUE(stored->features.Has(yeelight::Feature::kNightLight));
}

TEST(DiscoveryTest, RetriesTransientSsdpFailure) {
  yeelight::Registry registry;
  auto* probe = new FakeProbe({ParsedReply("192.168.1.10")}, 2);
  yeelight::Discovery discovery(FastConfig(), &registry,
                                std::unique_ptr<yeelight::DiscoveryProbe>(probe), nullptr);
  std::vector<yeelight::Device> devices;
  ASSERT_TRUE(discovery.Discover(&devices));
  EXPECT_EQ(devices.size(), 1u);
  EXPECT_EQ(probe->runs(), 3);
  EXPECT_EQ(discovery.GetMetrics().ssdp_failures, 2u);
}

TEST(DiscoveryTest, ExhaustedRetriesReportDiscoveryFailed) {
  yeelight::Registry registry;
  auto config = FastConfig();
  config.max_retries = 2;
  auto* probe = new FakeProbe({}, 100);
  yeelight::Discovery discovery(config, &registry,
                                std::unique_ptr<yeelight::DiscoveryProbe>(probe), nullptr);
  yeelight::Error error;
  EXPECT_FALSE(discovery.Discover(nullptr, &error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kDiscoveryFailed);
  EXPECT_EQ(probe->runs(), 3);
}

TEST(DiscoveryTest, MdnsFailureDoesNotBlockSsdpResults) {
  yeelight::Registry registry;
  yeelight::Discovery discovery(
      FastConfig(), &registry,
      std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({ParsedReply("192.168.1.10")})),
      std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({}, 100)));
  std::vector<yeelight::Device> devices;
  EXPECT_TRUE(discovery.Discover(&devices));
  EXPECT_EQ(devices.size(), 1u);
  EXPECT_EQ(discovery.GetMetrics().mdns_failures, 1u);
}

TEST(DiscoveryTest, CancellationReturnsPartialResults) {
  yeelight::Registry registry;
  auto config = FastConfig();
  config.window = std::chrono::milliseconds(10000);
  yeelight::Discovery discovery(
      config, &registry,
      std::unique_ptr<yeelight::DiscoveryProbe>(
          new FakeProbe({ParsedReply("192.168.1.10")}, 0, true)),
      std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({}, 0, true)));

  yeelight::CancelToken cancel;
  std::thread canceller([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.Cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  std::vector<yeelight::Device> devices;
  yeelight::Error error;
  EXPECT_FALSE(discovery.Discover(&devices, &error, &cancel));
  canceller.join();

  EXPECT_EQ(error.code, yeelight::ErrorCode::kCancelled);
  EXPECT_EQ(devices.size(), 1u);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(DiscoveryTest, RediscoveryKeepsSessionReportedState) {
  yeelight::Registry registry;
  yeelight::Device known;
  known.ip = "192.168.1.10";
  known.state = yeelight::LightState::On(30, yeelight::Color::Rgb(0, 0, 255));
  known.last_seen = yeelight::Device::Clock::now() - std::chrono::minutes(1);
  ASSERT_TRUE(registry.Upsert(known));

  yeelight::Discovery discovery(
      FastConfig(), &registry,
      std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({ParsedReply("192.168.1.10")})),
      nullptr);
  ASSERT_TRUE(discovery.Discover(nullptr));
  auto stored = registry.Get("192.168.1.10:55443");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->state, known.state);
  EXPECT_EQ(stored->model, "color");
}

TEST(DiscoveryTest, InvalidConfigRejected) {
  auto config = FastConfig();
  config.window = std::chrono::milliseconds(0);
  yeelight::Discovery discovery(config, nullptr,
                                std::unique_ptr<yeelight::DiscoveryProbe>(new FakeProbe({})),
                                nullptr);
  yeelight::Error error;
  EXPECT_FALSE(discovery.Discover(nullptr, &error));
  EXPECT_EQ(error.code, yeelight::ErrorCode::kInvalidConfig);
}

TEST(DiscoveryTest, SsdpProbeReadsLoopbackReplies) {
  // Unicast responder standing in for the multicast group.
  int responder = ::socket(AF_INET, SOCK_DGRAM, 0);
  ASSERT_GE(responder, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ASSERT_EQ(::bind(responder, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(::getsockname(responder, reinterpret_cast<sockaddr*>(&addr), &len), 0);
  const uint16_t port = ntohs(addr.sin_port);

  std::string search;
  std::thread thread([&]() {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(responder, &set);
    timeval tv{2, 0};
    if (::select(responder + 1, &set, nullptr, nullptr, &tv) <= 0) {
      return;
    }
    char buffer[1024];
    sockaddr_in src{};
    socklen_t src_len = sizeof(src);
    const ssize_t n = ::recvfrom(responder, buffer, sizeof(buffer), 0,
                                 reinterpret_cast<sockaddr*>(&src), &src_len);
    if (n <= 0) {
      return;
    }
    search.assign(buffer, static_cast<size_t>(n));
    for (const std::string& reply :
         {SsdpReply("10.0.0.2", "0x1", "mono"), std::string("garbage"),
          SsdpReply("10.0.0.3", "0x2", "color")}) {
      ::sendto(responder, reply.data(), reply.size(), 0, reinterpret_cast<sockaddr*>(&src),
               src_len);
    }
  });

  auto config = FastConfig();
  config.ssdp_address = "127.0.0.1";
  config.ssdp_port = port;
  config.bind_address = "127.0.0.1";
  yeelight::SsdpProbe probe(config);
  std::vector<yeelight::DiscoveryResult> results;
  yeelight::Error error;
  EXPECT_TRUE(probe.Run(std::chrono::milliseconds(500), nullptr,
                        [&](const yeelight::DiscoveryResult& result) {
                          results.push_back(result);
                        },
                        &error))
      << error.ToString();
  thread.join();
  ::close(responder);

  EXPECT_EQ(search, yeelight::test::BuildSsdpSearchRequest("127.0.0.1", port));
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].ip, "10.0.0.2");
  EXPECT_EQ(results[1].ip, "10.0.0.3");
  EXPECT_EQ(probe.malformed_replies(), 1u);
}
