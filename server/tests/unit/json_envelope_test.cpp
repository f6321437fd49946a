#include <chrono>

#include <gtest/gtest.h>

#include "wager/api_response.hpp"
#include "wager/event_lifecycle.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = wager::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = wager::MakeErrorEnvelope("betting_closed", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "betting_closed");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"]["detail"].is_null());

  auto with_detail = wager::MakeErrorEnvelope("feed_unavailable", "에러", "timeout");
  EXPECT_EQ(with_detail["error"]["detail"], "timeout");
}

TEST(JsonEnvelopeTest, EventReportsEffectiveStatus) {
  using namespace std::chrono_literals;
  wager::Event event;
  event.id = 9;
  event.participant_a = "Bears";
  event.participant_b = "Packers";
  event.starts_at = wager::FromEpochMillis(1'725'811'200'000);
  event.lock_at = wager::LockTimeFor(event.starts_at, 5min);
  event.stored_status = wager::EventStatus::kScheduled;

  auto open = wager::ToJson(event, event.lock_at - 1s);
  EXPECT_EQ(open["status"], "scheduled");
  EXPECT_TRUE(open["bettable"].get<bool>());
  EXPECT_TRUE(open["outcome"].is_null());

  auto locked = wager::ToJson(event, event.lock_at);
  EXPECT_EQ(locked["status"], "locked");
  EXPECT_FALSE(locked["bettable"].get<bool>());
}

TEST(JsonEnvelopeTest, WagerAmountsAreCents) {
  wager::Wager w;
  w.id = 1;
  w.user_id = 2;
  w.event_id = 3;
  w.pick = "Bears";
  w.stake = 4000;
  w.potential_payout = 8000;
  w.status = wager::WagerStatus::kPending;
  auto j = wager::ToJson(w);
  EXPECT_EQ(j["stake"], 4000);
  EXPECT_EQ(j["potentialPayout"], 8000);
  EXPECT_EQ(j["status"], "pending");
  EXPECT_TRUE(j["settledAt"].is_null());
  EXPECT_TRUE(j["requestId"].is_null());
}
