/*
 * 설명: 피드 동기화/즉시 정산/주기 스윕 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/feed_sync_it_test.cpp
 */
#include "wager/feed_synchronizer.hpp"

#include <utility>

namespace wager {

FeedSynchronizer::FeedSynchronizer(boost::asio::io_context& ioc, std::shared_ptr<GameFeed> feed,
                                   std::shared_ptr<EventStore> event_store,
                                   std::shared_ptr<SettlementEngine> settlement,
                                   std::shared_ptr<Observability> observability, std::chrono::seconds poll_interval,
                                   std::chrono::seconds sweep_interval)
    : poll_timer_(ioc), sweep_timer_(ioc), feed_(std::move(feed)), event_store_(std::move(event_store)),
      settlement_(std::move(settlement)), observability_(std::move(observability)), poll_interval_(poll_interval),
      sweep_interval_(sweep_interval) {}

SyncReport FeedSynchronizer::SyncOnce() {
  std::lock_guard<std::mutex> sync_lock(sync_mutex_);
  SyncReport report;
  if (!feed_) {
    report.feed_available = false;
    report.error = "피드가 설정되지 않았습니다";
    return report;
  }

  std::vector<FeedUpdate> updates;
  try {
    updates = feed_->Fetch();
  } catch (const FeedException& ex) {
    report.feed_available = false;
    report.error = ex.what();
    if (observability_) {
      observability_->IncrementFeedFailure();
      observability_->LogEvent(LogLevel::kWarn, "feed_unavailable",
                               {{"error", ex.what()},
                                {"kind", ex.kind == FeedErrorKind::kUnavailable ? "unavailable" : "data_inconsistent"}});
    }
    return report;
  }

  report.received = updates.size();
  for (const auto& update : updates) {
    try {
      auto outcome = event_store_->RecordFeedUpdate(update);
      Tally(outcome, report);
      if (NeedsSettlement(outcome)) {
        auto settled = settlement_->SettleEvent(outcome.event_id);
        if (outcome.became_terminal || settled.Settled() > 0) {
          ++report.settled_events;
        }
      }
    } catch (const DbException& ex) {
      // 다음 동기화에서 같은 갱신이 다시 들어오므로 건너뛴다.
      ++report.failed;
      if (observability_) {
        observability_->LogEvent(LogLevel::kError, "feed_update_failed",
                                 {{"feedEventId", update.feed_event_id}, {"error", ex.what()}});
      }
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_success_ = std::chrono::system_clock::now();
  }
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "feed_synced",
                             {{"received", report.received},
                              {"created", report.created},
                              {"applied", report.applied},
                              {"noop", report.noop},
                              {"rejected", report.rejected},
                              {"failed", report.failed},
                              {"settledEvents", report.settled_events}});
  }
  return report;
}

FeedApplyOutcome FeedSynchronizer::Ingest(const FeedUpdate& update) {
  auto outcome = event_store_->RecordFeedUpdate(update);
  SyncReport ignored;
  Tally(outcome, ignored);
  if (NeedsSettlement(outcome)) {
    settlement_->SettleEvent(outcome.event_id);
  }
  return outcome;
}

// 이미 종료된 경기의 중복 신호도 정산을 다시 시도한다. 정산은 대기 베팅에만 적용되므로 반복해도 안전하다.
bool FeedSynchronizer::NeedsSettlement(const FeedApplyOutcome& outcome) const {
  if (!settlement_) {
    return false;
  }
  if (outcome.became_terminal) {
    return true;
  }
  return outcome.result == FeedApplyResult::kNoop && IsTerminal(outcome.current_status);
}

void FeedSynchronizer::Tally(const FeedApplyOutcome& outcome, SyncReport& report) const {
  switch (outcome.result) {
    case FeedApplyResult::kCreated:
      ++report.created;
      break;
    case FeedApplyResult::kApplied:
      ++report.applied;
      break;
    case FeedApplyResult::kNoop:
      ++report.noop;
      break;
    case FeedApplyResult::kRejected:
      ++report.rejected;
      break;
  }
  if (!observability_) {
    return;
  }
  if (outcome.result == FeedApplyResult::kRejected) {
    observability_->IncrementFeedRejected();
    observability_->LogEvent(LogLevel::kWarn, "feed_update_rejected",
                             {{"eventId", outcome.event_id}, {"reason", outcome.reason}});
  } else if (outcome.result != FeedApplyResult::kNoop) {
    observability_->IncrementFeedApplied();
    observability_->LogEvent(LogLevel::kDebug, "feed_update_applied",
                             {{"eventId", outcome.event_id},
                              {"result", std::string(ToString(outcome.result))},
                              {"from", std::string(ToString(outcome.previous_status))},
                              {"to", std::string(ToString(outcome.current_status))}});
  }
}

void FeedSynchronizer::Start() {
  if (running_.exchange(true)) {
    return;
  }
  if (feed_ && poll_interval_.count() > 0) {
    SchedulePoll(std::chrono::seconds(0));
  }
  if (sweep_interval_.count() > 0) {
    ScheduleSweep();
  }
}

void FeedSynchronizer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  poll_timer_.cancel();
  sweep_timer_.cancel();
}

std::optional<TimePoint> FeedSynchronizer::LastSuccessfulSync() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_success_;
}

void FeedSynchronizer::SchedulePoll(std::chrono::steady_clock::duration delay) {
  poll_timer_.expires_after(delay);
  auto self = shared_from_this();
  poll_timer_.async_wait([self](const boost::system::error_code& ec) { self->OnPoll(ec); });
}

void FeedSynchronizer::OnPoll(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  try {
    SyncOnce();
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "feed_poll_failed", {{"error", ex.what()}});
    }
  }
  SchedulePoll(poll_interval_);
}

void FeedSynchronizer::ScheduleSweep() {
  sweep_timer_.expires_after(sweep_interval_);
  auto self = shared_from_this();
  sweep_timer_.async_wait([self](const boost::system::error_code& ec) { self->OnSweep(ec); });
}

void FeedSynchronizer::OnSweep(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  if (settlement_) {
    try {
      settlement_->SettleCompletedEvents();
    } catch (const DbException& ex) {
      if (observability_) {
        observability_->LogEvent(LogLevel::kError, "settlement_sweep_failed", {{"error", ex.what()}});
      }
    }
  }
  ScheduleSweep();
}

}  // namespace wager
