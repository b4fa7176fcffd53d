#include <gtest/gtest.h>

#include "companion_connector.hpp"
#include "test_utils.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace ask_continue;

namespace {

struct Recorder {
  int discover_calls = 0;
  std::vector<int> attempted_ports;
  std::vector<std::chrono::milliseconds> sleeps;
};

BridgeConfig FastConfig(int rounds) {
  BridgeConfig cfg;
  cfg.max_connect_rounds = rounds;
  cfg.retry_interval = std::chrono::milliseconds(5000);
  return cfg;
}

CompanionConnector MakeConnector(const BridgeConfig& cfg,
                                 Recorder* rec,
                                 std::function<std::vector<int>(int round)> ports,
                                 std::function<AttemptOutcome(int port, int round)> attempt) {
  return CompanionConnector(
      cfg,
      [rec, ports]() {
        rec->discover_calls++;
        return ports(rec->discover_calls);
      },
      [rec, attempt](int port, const std::string&, const std::string&, int) {
        rec->attempted_ports.push_back(port);
        return attempt(port, rec->discover_calls);
      },
      [rec](std::chrono::milliseconds d) { rec->sleeps.push_back(d); });
}

}  // namespace

TEST(CompanionConnectorTest, AcceptsOnFirstCandidateWithoutSleeping) {
  Recorder rec;
  auto connector = MakeConnector(
      FastConfig(5), &rec, [](int) { return std::vector<int>{24001, 24002}; },
      [](int, int) { return AttemptOutcome{AttemptKind::kAccepted, {}}; });

  auto r = connector.Connect("req_a", "reason", 24555);
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.rounds, 1);
  EXPECT_EQ(r.accepted_port, 24001);
  EXPECT_FALSE(r.last_error.has_value());
  EXPECT_EQ(rec.attempted_ports, std::vector<int>{24001});
  EXPECT_TRUE(rec.sleeps.empty());
}

TEST(CompanionConnectorTest, TriesCandidatesInOrderUntilOneAccepts) {
  Recorder rec;
  auto connector = MakeConnector(
      FastConfig(5), &rec, [](int) { return std::vector<int>{24001, 24002, 24003}; },
      [](int port, int) {
        if (port == 24002) return AttemptOutcome{AttemptKind::kAccepted, {}};
        return AttemptOutcome{AttemptKind::kUnreachable, "cannot connect to port " + std::to_string(port)};
      });

  auto r = connector.Connect("req_a", "reason", 24555);
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.accepted_port, 24002);
  EXPECT_EQ(rec.attempted_ports, (std::vector<int>{24001, 24002}));
}

TEST(CompanionConnectorTest, ExhaustsRoundsAndKeepsMostRecentError) {
  Recorder rec;
  auto connector = MakeConnector(
      FastConfig(5), &rec, [](int) { return std::vector<int>{24001, 24002}; },
      [](int port, int round) {
        return AttemptOutcome{AttemptKind::kUnreachable,
                              "round " + std::to_string(round) + " port " + std::to_string(port)};
      });

  auto r = connector.Connect("req_a", "reason", 24555);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.rounds, 5);
  EXPECT_EQ(rec.discover_calls, 5);
  EXPECT_EQ(rec.attempted_ports.size(), 10u);
  ASSERT_TRUE(r.last_error.has_value());
  EXPECT_EQ(*r.last_error, "round 5 port 24002");
}

TEST(CompanionConnectorTest, SleepsBetweenRoundsButNotAfterTheLast) {
  Recorder rec;
  auto connector = MakeConnector(
      FastConfig(5), &rec, [](int) { return std::vector<int>{24001}; },
      [](int, int) { return AttemptOutcome{AttemptKind::kTimedOut, "timed out"}; });

  connector.Connect("req_a", "reason", 24555);
  ASSERT_EQ(rec.sleeps.size(), 4u);
  for (const auto& d : rec.sleeps) EXPECT_EQ(d, std::chrono::milliseconds(5000));
}

TEST(CompanionConnectorTest, RediscoversCandidatesEveryRound) {
  Recorder rec;
  auto connector = MakeConnector(
      FastConfig(5), &rec,
      [](int round) { return round < 3 ? std::vector<int>{23983} : std::vector<int>{23983, 24100}; },
      [](int port, int) {
        if (port == 24100) return AttemptOutcome{AttemptKind::kAccepted, {}};
        return AttemptOutcome{AttemptKind::kUnreachable, "no companion"};
      });

  auto r = connector.Connect("req_a", "reason", 24555);
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.rounds, 3);
  EXPECT_EQ(r.accepted_port, 24100);
  EXPECT_EQ(rec.sleeps.size(), 2u);
}

TEST(CompanionConnectorTest, RefusalDoesNotStopTheRound) {
  Recorder rec;
  auto connector = MakeConnector(
      FastConfig(1), &rec, [](int) { return std::vector<int>{24001, 24002}; },
      [](int port, int) {
        if (port == 24001) return AttemptOutcome{AttemptKind::kRefused, "companion error: busy - "};
        return AttemptOutcome{AttemptKind::kAccepted, {}};
      });

  auto r = connector.Connect("req_a", "reason", 24555);
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.accepted_port, 24002);
}

TEST(CompanionConnectorTest, NonPositiveRoundCountStillTriesOnce) {
  Recorder rec;
  auto connector = MakeConnector(
      FastConfig(0), &rec, [](int) { return std::vector<int>{24001}; },
      [](int, int) { return AttemptOutcome{AttemptKind::kUnreachable, "down"}; });

  auto r = connector.Connect("req_a", "reason", 24555);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.rounds, 1);
  EXPECT_TRUE(rec.sleeps.empty());
}

TEST(CompanionConnectorTest, ElapsedTimeTracksRetryInterval) {
  BridgeConfig cfg;
  cfg.max_connect_rounds = 3;
  cfg.retry_interval = std::chrono::milliseconds(100);
  CompanionConnector connector(
      cfg, []() { return std::vector<int>{24001}; },
      [](int, const std::string&, const std::string&, int) {
        return AttemptOutcome{AttemptKind::kUnreachable, "down"};
      },
      [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); });

  const auto start = std::chrono::steady_clock::now();
  auto r = connector.Connect("req_a", "reason", 24555);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(r.ok);
  EXPECT_GE(elapsed, std::chrono::milliseconds(200));
  EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(CompanionConnectorTest, DefaultWiringFallsBackToUnreachableDefaultPort) {
  ask_continue::test::TempDir dir;
  auto cfg = ask_continue::test::TestConfig(dir.str());
  cfg.max_connect_rounds = 2;
  CompanionConnector connector(cfg);

  auto r = connector.Connect("req_a", "reason", 24555);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.rounds, 2);
  ASSERT_TRUE(r.last_error.has_value());
  EXPECT_NE(r.last_error->find(std::to_string(cfg.default_companion_port)), std::string::npos);
}

TEST(CompanionConnectorTest, DefaultWiringReachesDiscoveredCompanion) {
  ask_continue::test::TempDir dir;
  ask_continue::test::FakeCompanion companion;
  dir.Write("1.port", nlohmann::json{{"port", companion.port()}}.dump());
  auto cfg = ask_continue::test::TestConfig(dir.str());
  CompanionConnector connector(cfg);

  auto r = connector.Connect("req_a", "reason", 24555);
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.accepted_port, companion.port());
  ASSERT_EQ(companion.Asks().size(), 1u);
  EXPECT_EQ(companion.Asks()[0]["requestId"], "req_a");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
