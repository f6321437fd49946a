#include <deque>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "it_support.hpp"
#include "wager/feed_synchronizer.hpp"
#include "wager/game_feed.hpp"

using wager::EventStatus;
using wager_it::StoreFixture;

namespace {
// 호출마다 준비된 배치를 하나씩 돌려준다. 배치가 없으면 피드 장애를 흉내 낸다.
class ScriptedFeed : public wager::GameFeed {
 public:
  void Push(std::vector<wager::FeedUpdate> batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.push_back(std::move(batch));
  }

  std::vector<wager::FeedUpdate> Fetch() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    if (batches_.empty()) {
      throw wager::FeedException(wager::FeedErrorKind::kUnavailable, "scripted outage");
    }
    auto batch = std::move(batches_.front());
    batches_.pop_front();
    return batch;
  }

  int Calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

 private:
  std::mutex mutex_;
  std::deque<std::vector<wager::FeedUpdate>> batches_;
  int calls_{0};
};
}  // namespace

class FeedSyncItTest : public StoreFixture {
 protected:
  void SetUp() override {
    StoreFixture::SetUp();
    if (IsSkipped()) {
      return;
    }
    feed_ = std::make_shared<ScriptedFeed>();
    sync_ = std::make_shared<wager::FeedSynchronizer>(ioc_, feed_, event_store_, settlement_, observability_,
                                                      std::chrono::seconds(0), std::chrono::seconds(0));
  }

  std::int64_t NewUser(const std::string& external_id) {
    wager::Ledger ledger(db_, 10000);
    return ledger.EnsureUser(external_id, external_id).id;
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<ScriptedFeed> feed_;
  std::shared_ptr<wager::FeedSynchronizer> sync_;
};

TEST_F(FeedSyncItTest, FinalUpdateSettlesImmediately) {
  auto event = SeedEvent("feed-final");
  auto user = NewUser("feed-final-user");
  wager::ServiceError error;
  auto placed = Place(user, event.id, "Packers", 5000, error);
  ASSERT_TRUE(placed.has_value());

  feed_->Push({Update("feed-final", EventStatus::kInProgress, 0, 7), Update("feed-final", EventStatus::kFinal, 3, 17)});
  auto report = sync_->SyncOnce();
  EXPECT_TRUE(report.feed_available);
  EXPECT_EQ(report.received, 2u);
  EXPECT_EQ(report.applied, 2u);
  EXPECT_EQ(report.settled_events, 1u);
  EXPECT_EQ(Balance(user), 15000);
  EXPECT_EQ(betting_->GetWager(user, placed->id)->status, wager::WagerStatus::kWon);
  EXPECT_TRUE(sync_->LastSuccessfulSync().has_value());
}

TEST_F(FeedSyncItTest, NewEventsAreCreated) {
  feed_->Push({Update("feed-a", EventStatus::kScheduled), Update("feed-b", EventStatus::kScheduled)});
  auto report = sync_->SyncOnce();
  EXPECT_EQ(report.created, 2u);
  EXPECT_EQ(event_store_->ListBettable(now_).size(), 2u);
}

TEST_F(FeedSyncItTest, OutageChangesNothing) {
  auto event = SeedEvent("feed-outage");
  auto report = sync_->SyncOnce();
  EXPECT_FALSE(report.feed_available);
  EXPECT_FALSE(report.error.empty());
  EXPECT_EQ(report.received, 0u);
  EXPECT_FALSE(sync_->LastSuccessfulSync().has_value());
  EXPECT_EQ(event_store_->GetEvent(event.id)->stored_status, EventStatus::kScheduled);
  EXPECT_EQ(observability_->Snapshot().feed_failures, 1u);
}

TEST_F(FeedSyncItTest, DuplicateAndStaleDeliveriesAreHarmless) {
  auto event = SeedEvent("feed-dup");
  auto user = NewUser("feed-dup-user");
  wager::ServiceError error;
  ASSERT_TRUE(Place(user, event.id, "Bears", 2000, error).has_value());

  feed_->Push({Update("feed-dup", EventStatus::kFinal, 20, 6)});
  feed_->Push({Update("feed-dup", EventStatus::kFinal, 20, 6), Update("feed-dup", EventStatus::kInProgress, 13, 6)});
  sync_->SyncOnce();
  auto second = sync_->SyncOnce();
  EXPECT_EQ(second.noop, 1u);
  EXPECT_EQ(second.rejected, 1u);
  EXPECT_EQ(second.settled_events, 0u);
  EXPECT_EQ(Balance(user), 12000);
  EXPECT_EQ(ledger_->GetAuditTrail(user).size(), 3u);
}

TEST_F(FeedSyncItTest, RepeatedFinalRetriesFailedSettlement) {
  auto event = SeedEvent("feed-retry");
  auto user = NewUser("feed-retry-user");
  wager::ServiceError error;
  auto placed = Place(user, event.id, "Bears", 4000, error);
  ASSERT_TRUE(placed.has_value());

  // 결과 기록 트랜잭션만 통과시키고 그 뒤의 정산 연결은 모두 실패시킨다.
  int connections = 0;
  db_->SetTransientInjector([&connections](std::size_t) { return ++connections > 1; });
  feed_->Push({Update("feed-retry", EventStatus::kFinal, 27, 3)});
  auto first = sync_->SyncOnce();
  db_->SetTransientInjector(nullptr);
  EXPECT_EQ(first.applied, 1u);
  EXPECT_EQ(first.failed, 1u);
  EXPECT_EQ(event_store_->GetEvent(event.id)->stored_status, EventStatus::kFinal);
  EXPECT_EQ(betting_->GetWager(user, placed->id)->status, wager::WagerStatus::kPending);
  EXPECT_EQ(Balance(user), 6000);

  feed_->Push({Update("feed-retry", EventStatus::kFinal, 27, 3)});
  auto second = sync_->SyncOnce();
  EXPECT_EQ(second.noop, 1u);
  EXPECT_EQ(second.failed, 0u);
  EXPECT_EQ(second.settled_events, 1u);
  EXPECT_EQ(betting_->GetWager(user, placed->id)->status, wager::WagerStatus::kWon);
  EXPECT_EQ(Balance(user), 14000);

  // 푸시 경로의 중복 신호는 이미 정산된 베팅을 다시 건드리지 않는다.
  auto pushed = sync_->Ingest(Update("feed-retry", EventStatus::kFinal, 27, 3));
  EXPECT_EQ(pushed.result, wager::FeedApplyResult::kNoop);
  EXPECT_EQ(Balance(user), 14000);
  EXPECT_EQ(ledger_->GetAuditTrail(user).size(), 3u);
}

TEST_F(FeedSyncItTest, IngestSettlesCancelledEvent) {
  auto event = SeedEvent("feed-push");
  auto user = NewUser("feed-push-user");
  wager::ServiceError error;
  ASSERT_TRUE(Place(user, event.id, "Bears", 3000, error).has_value());

  auto outcome = sync_->Ingest(Update("feed-push", EventStatus::kCancelled));
  EXPECT_EQ(outcome.result, wager::FeedApplyResult::kApplied);
  EXPECT_TRUE(outcome.became_terminal);
  EXPECT_EQ(Balance(user), 10000);
  EXPECT_TRUE(event_store_->ListEventsAwaitingSettlement().empty());
}

TEST_F(FeedSyncItTest, PollTimerDrivesSync) {
  auto polling = std::make_shared<wager::FeedSynchronizer>(ioc_, feed_, event_store_, settlement_, observability_,
                                                           std::chrono::seconds(1), std::chrono::seconds(0));
  feed_->Push({Update("feed-timer", EventStatus::kScheduled)});
  polling->Start();
  ioc_.run_for(std::chrono::milliseconds(1500));
  polling->Stop();
  ioc_.run_for(std::chrono::milliseconds(50));

  EXPECT_GE(feed_->Calls(), 2);
  EXPECT_TRUE(event_store_->FindByFeedId("feed-timer").has_value());
}
