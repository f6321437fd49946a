#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "wager/observability.hpp"

namespace {

std::vector<nlohmann::json> Lines(const std::ostringstream& out) {
  std::vector<nlohmann::json> lines;
  std::istringstream in(out.str());
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(nlohmann::json::parse(line));
  }
  return lines;
}

}  // namespace

TEST(ObservabilityTest, WritesStructuredLine) {
  std::ostringstream out;
  wager::Observability obs(wager::LogLevel::kInfo, &out);
  wager::LogContext ctx;
  ctx.trace_id = "t-1";
  ctx.user_id = 42;
  ctx.name = "wager_placed";
  ctx.latency_ms = 3;
  ctx.fields = {{"wagerId", 7}};
  obs.Log(ctx);

  auto lines = Lines(out);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0]["eventName"], "wager_placed");
  EXPECT_EQ(lines[0]["traceId"], "t-1");
  EXPECT_EQ(lines[0]["userId"], 42);
  EXPECT_EQ(lines[0]["level"], "info");
  EXPECT_EQ(lines[0]["wagerId"], 7);
  EXPECT_TRUE(lines[0]["ts"].is_string());
}

TEST(ObservabilityTest, SuppressesBelowMinimumLevel) {
  std::ostringstream out;
  wager::Observability obs(wager::LogLevel::kWarn, &out);
  obs.LogEvent(wager::LogLevel::kInfo, "feed_synced");
  obs.LogEvent(wager::LogLevel::kError, "settlement_wager_failed", {{"wagerId", 1}});

  auto lines = Lines(out);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0]["eventName"], "settlement_wager_failed");
  EXPECT_EQ(lines[0]["level"], "error");
}

TEST(ObservabilityTest, CountersAccumulate) {
  std::ostringstream out;
  wager::Observability obs(wager::LogLevel::kInfo, &out);
  obs.IncrementWagersPlaced();
  obs.IncrementWagersPlaced();
  obs.AddWagersSettled(5);
  obs.IncrementFeedFailure();
  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.wagers_placed, 2u);
  EXPECT_EQ(snapshot.wagers_settled, 5u);
  EXPECT_EQ(snapshot.feed_failures, 1u);
  EXPECT_EQ(snapshot.request_total, 0u);
}

TEST(ObservabilityTest, ParsesLevelNames) {
  EXPECT_EQ(wager::ParseLogLevel("debug"), wager::LogLevel::kDebug);
  EXPECT_EQ(wager::ParseLogLevel("warn"), wager::LogLevel::kWarn);
  EXPECT_EQ(wager::ParseLogLevel("error"), wager::LogLevel::kError);
  EXPECT_EQ(wager::ParseLogLevel("unknown"), wager::LogLevel::kInfo);
}
