#include <gtest/gtest.h>

#include "e2e_support.hpp"

using boost::beast::http::status;
using boost::beast::http::verb;
using wager_e2e::ExpectErrorEnvelope;
using wager_e2e::ExpectSuccessEnvelope;

namespace {
class OpsFeedFixture : public wager_e2e::ServerFixture {
 protected:
  OpsFeedFixture() : ServerFixture(18091) {}
};
}  // namespace

TEST_F(OpsFeedFixture, OpsRoutesRequireToken) {
  auto anonymous = Get("/ops/status");
  EXPECT_EQ(anonymous.status, status::unauthorized);
  ExpectErrorEnvelope(anonymous.body, "unauthorized");

  auto wrong = Send(verb::get, "/ops/status", nullptr, "", "not-the-token");
  EXPECT_EQ(wrong.status, status::unauthorized);

  auto ok = Ops(verb::get, "/ops/status");
  ASSERT_EQ(ok.status, status::ok);
  ExpectSuccessEnvelope(ok.body);
  EXPECT_TRUE(ok.body["data"]["lastFeedSync"].is_null());
  EXPECT_TRUE(ok.body["data"]["eventsAwaitingSettlement"].is_array());
}

TEST_F(OpsFeedFixture, HealthAndMetrics) {
  auto health = Get("/api/health");
  ASSERT_EQ(health.status, status::ok);
  ExpectSuccessEnvelope(health.body);

  auto first = Get("/metrics");
  ASSERT_EQ(first.status, status::ok);
  auto initial_total = first.body["data"]["requests"]["total"].get<std::uint64_t>();
  Get("/api/events");
  auto second = Get("/metrics");
  EXPECT_GE(second.body["data"]["requests"]["total"].get<std::uint64_t>(), initial_total + 2);
  EXPECT_TRUE(second.body["data"]["wagers"].contains("placed"));
}

TEST_F(OpsFeedFixture, SyncWithoutFeedReportsUnavailable) {
  auto res = Ops(verb::post, "/ops/feed/sync");
  EXPECT_EQ(res.status, status::service_unavailable);
  ExpectErrorEnvelope(res.body, "feed_unavailable");
}

TEST_F(OpsFeedFixture, FeedPushValidatesTransitions) {
  auto event_id = PushScheduledEvent("ops-evt");

  auto repeat = Ops(verb::post, "/ops/feed/updates", {{"feedEventId", "ops-evt"}, {"status", "scheduled"}});
  EXPECT_EQ(repeat.status, status::ok);
  EXPECT_EQ(repeat.body["data"]["result"], "noop");

  auto unknown_status = Ops(verb::post, "/ops/feed/updates", {{"feedEventId", "ops-evt"}, {"status", "paused"}});
  EXPECT_EQ(unknown_status.status, status::bad_request);

  auto premature = Ops(verb::post, "/ops/events/" + std::to_string(event_id) + "/settle");
  EXPECT_EQ(premature.status, status::conflict);
  ExpectErrorEnvelope(premature.body, "event_not_completed");

  auto final_update =
      Ops(verb::post, "/ops/feed/updates", {{"feedEventId", "ops-evt"}, {"status", "final"}, {"scoreA", 3}, {"scoreB", 3}});
  ASSERT_EQ(final_update.status, status::ok);

  auto rewrite =
      Ops(verb::post, "/ops/feed/updates", {{"feedEventId", "ops-evt"}, {"status", "final"}, {"scoreA", 6}, {"scoreB", 3}});
  EXPECT_EQ(rewrite.status, status::conflict);
  ExpectErrorEnvelope(rewrite.body, "feed_update_rejected");

  auto event = Get("/api/events/" + std::to_string(event_id));
  ASSERT_EQ(event.status, status::ok);
  EXPECT_EQ(event.body["data"]["status"], "final");
  EXPECT_TRUE(event.body["data"]["outcome"]["tie"].get<bool>());
  EXPECT_TRUE(event.body["data"]["outcome"]["winner"].is_null());

  auto missing = Get("/api/events/424242");
  EXPECT_EQ(missing.status, status::not_found);
  ExpectErrorEnvelope(missing.body, "unknown_event");
}

TEST_F(OpsFeedFixture, CancelledEventRefundsAndSweepIsIdle) {
  auto token = OpenSession("ops-refund");
  auto event_id = PushScheduledEvent("ops-cancel");
  auto placed = PostJson("/api/wagers", {{"eventId", event_id}, {"pick", "Bears"}, {"stake", 4000}}, token);
  ASSERT_EQ(placed.status, status::created);

  auto cancel = Ops(verb::post, "/ops/feed/updates", {{"feedEventId", "ops-cancel"}, {"status", "cancelled"}});
  ASSERT_EQ(cancel.status, status::ok);
  EXPECT_TRUE(cancel.body["data"]["becameTerminal"].get<bool>());

  auto wager = Get("/api/wagers/" + placed.body["data"]["id"].dump(), token);
  EXPECT_EQ(wager.body["data"]["status"], "cancelled");
  EXPECT_EQ(Get("/api/me", token).body["data"]["balance"], 10000);

  auto sweep = Ops(verb::post, "/ops/settlement/sweep");
  ASSERT_EQ(sweep.status, status::ok);
  EXPECT_TRUE(sweep.body["data"]["reports"].empty());

  auto metrics = app_->GetObservability()->Snapshot();
  EXPECT_EQ(metrics.wagers_placed, 1u);
  EXPECT_EQ(metrics.wagers_settled, 1u);
}
