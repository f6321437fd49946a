#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "it_support.hpp"

using wager_it::StoreFixture;

class SettlementItTest : public StoreFixture {
 protected:
  std::int64_t NewUser(const std::string& external_id) {
    wager::Ledger ledger(db_, 10000);
    return ledger.EnsureUser(external_id, external_id).id;
  }

  wager::Money AuditSum(std::int64_t user_id) {
    wager::Money sum = 0;
    for (const auto& entry : ledger_->GetAuditTrail(user_id)) {
      sum += entry.amount;
    }
    return sum;
  }
};

TEST_F(SettlementItTest, SecondRunIsNoop) {
  auto user = NewUser("idem");
  auto event = SeedEvent("evt-idem");
  wager::ServiceError error;
  ASSERT_TRUE(Place(user, event.id, "Bears", 4000, error).has_value());
  FinishEvent("evt-idem", 31, 10);

  auto first = settlement_->SettleEvent(event.id);
  EXPECT_EQ(first.won, 1u);
  auto second = settlement_->SettleEvent(event.id);
  EXPECT_EQ(second.examined, 0u);
  EXPECT_EQ(second.Settled(), 0u);
  EXPECT_EQ(Balance(user), 14000);
}

TEST_F(SettlementItTest, NonTerminalEventIsLeftAlone) {
  auto user = NewUser("early");
  auto event = SeedEvent("evt-early");
  wager::ServiceError error;
  auto placed = Place(user, event.id, "Bears", 4000, error);
  ASSERT_TRUE(placed.has_value());

  auto report = settlement_->SettleEvent(event.id);
  EXPECT_EQ(report.examined, 0u);
  EXPECT_EQ(betting_->GetWager(user, placed->id)->status, wager::WagerStatus::kPending);
}

TEST_F(SettlementItTest, ConcurrentSettlersPayEachWagerOnce) {
  std::vector<std::int64_t> users;
  auto event = SeedEvent("evt-race");
  wager::ServiceError error;
  for (int i = 0; i < 6; ++i) {
    users.push_back(NewUser("race-" + std::to_string(i)));
    ASSERT_TRUE(Place(users.back(), event.id, i % 2 == 0 ? "Bears" : "Packers", 2000, error).has_value());
  }
  FinishEvent("evt-race", 21, 14);

  std::vector<std::thread> threads;
  std::atomic<std::size_t> settled{0};
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&]() { settled.fetch_add(settlement_->SettleEvent(event.id).Settled()); });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(settled.load(), 6u);
  for (std::size_t i = 0; i < users.size(); ++i) {
    EXPECT_EQ(Balance(users[i]), i % 2 == 0 ? 12000 : 8000);
    EXPECT_EQ(AuditSum(users[i]), Balance(users[i]));
  }
}

TEST_F(SettlementItTest, CancelledEventRefundsEveryStake) {
  auto a = NewUser("refund-a");
  auto b = NewUser("refund-b");
  auto event = SeedEvent("evt-refund");
  wager::ServiceError error;
  auto wa = Place(a, event.id, "Bears", 2500, error);
  auto wb = Place(b, event.id, "Packers", 7000, error);
  ASSERT_TRUE(wa && wb);

  CancelEvent("evt-refund");
  auto report = settlement_->SettleEvent(event.id);
  EXPECT_EQ(report.refunded, 2u);
  EXPECT_EQ(Balance(a), 10000);
  EXPECT_EQ(Balance(b), 10000);

  auto refunded = betting_->GetWager(a, wa->id);
  EXPECT_EQ(refunded->status, wager::WagerStatus::kCancelled);
  EXPECT_EQ(refunded->realized_payout, 2500);
  EXPECT_EQ(ledger_->GetAuditTrail(a).back().reason, wager::kReasonEventCancelled);
}

TEST_F(SettlementItTest, UserCancelRacingEventCancelRefundsOnce) {
  for (int round = 0; round < 5; ++round) {
    auto user = NewUser("cancel-race-" + std::to_string(round));
    auto feed_id = "evt-cancel-race-" + std::to_string(round);
    auto event = SeedEvent(feed_id);
    wager::ServiceError error;
    auto placed = Place(user, event.id, "Bears", 4000, error);
    ASSERT_TRUE(placed.has_value());

    std::thread user_cancel([&]() {
      wager::ServiceError cancel_error;
      betting_->CancelWager(user, placed->id, cancel_error);
    });
    std::thread event_cancel([&]() {
      event_store_->RecordFeedUpdate(Update(feed_id, wager::EventStatus::kCancelled));
      settlement_->SettleEvent(event.id);
    });
    user_cancel.join();
    event_cancel.join();

    EXPECT_EQ(Balance(user), 10000);
    EXPECT_EQ(ledger_->GetAuditTrail(user).size(), 3u);
    EXPECT_EQ(betting_->GetWager(user, placed->id)->status, wager::WagerStatus::kCancelled);
  }
}

TEST_F(SettlementItTest, ValueIsConserved) {
  auto event = SeedEvent("evt-conserve");
  std::vector<std::int64_t> users;
  wager::ServiceError error;
  wager::Money staked = 0;
  for (int i = 0; i < 5; ++i) {
    users.push_back(NewUser("conserve-" + std::to_string(i)));
    wager::Money stake = 1000 * (i + 1);
    ASSERT_TRUE(Place(users.back(), event.id, i < 2 ? "Bears" : "Packers", stake, error).has_value());
    staked += stake;
  }
  FinishEvent("evt-conserve", 3, 0);
  settlement_->SettleEvent(event.id);

  // Bears 승리: 1번, 2번 사용자만 2배 지급.
  wager::Money paid = 2 * (1000 + 2000);
  wager::Money total = 0;
  for (auto user : users) {
    total += Balance(user);
    EXPECT_EQ(AuditSum(user), Balance(user));
  }
  EXPECT_EQ(total, 5 * 10000 - staked + paid);
}

TEST_F(SettlementItTest, SweepSettlesMissedEvents) {
  auto user = NewUser("sweep");
  auto event = SeedEvent("evt-sweep");
  wager::ServiceError error;
  ASSERT_TRUE(Place(user, event.id, "Packers", 4000, error).has_value());
  FinishEvent("evt-sweep", 7, 9);

  EXPECT_EQ(event_store_->ListEventsAwaitingSettlement(), std::vector<std::int64_t>{event.id});
  auto reports = settlement_->SettleCompletedEvents();
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].won, 1u);
  EXPECT_TRUE(event_store_->ListEventsAwaitingSettlement().empty());
  EXPECT_EQ(Balance(user), 14000);
}

TEST_F(SettlementItTest, TransientFailureIsRetried) {
  auto user = NewUser("transient");
  auto event = SeedEvent("evt-transient");
  wager::ServiceError error;
  ASSERT_TRUE(Place(user, event.id, "Bears", 4000, error).has_value());
  FinishEvent("evt-transient", 14, 3);

  db_->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });
  auto report = settlement_->SettleEvent(event.id);
  db_->SetTransientInjector(nullptr);

  EXPECT_EQ(report.won, 1u);
  EXPECT_EQ(report.failed, 0u);
  EXPECT_EQ(Balance(user), 14000);
}
