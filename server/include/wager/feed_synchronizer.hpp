/*
 * 설명: 외부 피드의 경기 갱신을 이벤트 저장소에 반영하고, 종료/취소로 바뀐 경기는 곧바로 정산한다.
 *       주기 폴링과 정산 스윕은 io_context 타이머에서 돈다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/feed_sync_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "wager/event_store.hpp"
#include "wager/game_feed.hpp"
#include "wager/observability.hpp"
#include "wager/settlement_engine.hpp"

namespace wager {

struct SyncReport {
  bool feed_available{true};
  std::string error;
  std::size_t received{0};
  std::size_t created{0};
  std::size_t applied{0};
  std::size_t noop{0};
  std::size_t rejected{0};
  std::size_t failed{0};
  std::size_t settled_events{0};
};

class FeedSynchronizer : public std::enable_shared_from_this<FeedSynchronizer> {
 public:
  // feed가 nullptr이면 폴링 없이 Ingest(푸시)만 동작한다.
  FeedSynchronizer(boost::asio::io_context& ioc, std::shared_ptr<GameFeed> feed, std::shared_ptr<EventStore> event_store,
                   std::shared_ptr<SettlementEngine> settlement, std::shared_ptr<Observability> observability,
                   std::chrono::seconds poll_interval, std::chrono::seconds sweep_interval);

  // 피드 장애는 예외가 아니라 feed_available=false로 보고한다. 이 경우 저장소는 바뀌지 않는다.
  SyncReport SyncOnce();
  FeedApplyOutcome Ingest(const FeedUpdate& update);

  void Start();
  void Stop();

  std::optional<TimePoint> LastSuccessfulSync() const;

 private:
  void Tally(const FeedApplyOutcome& outcome, SyncReport& report) const;
  bool NeedsSettlement(const FeedApplyOutcome& outcome) const;
  void SchedulePoll(std::chrono::steady_clock::duration delay);
  void OnPoll(const boost::system::error_code& ec);
  void ScheduleSweep();
  void OnSweep(const boost::system::error_code& ec);

  boost::asio::steady_timer poll_timer_;
  boost::asio::steady_timer sweep_timer_;
  std::shared_ptr<GameFeed> feed_;
  std::shared_ptr<EventStore> event_store_;
  std::shared_ptr<SettlementEngine> settlement_;
  std::shared_ptr<Observability> observability_;
  std::chrono::seconds poll_interval_;
  std::chrono::seconds sweep_interval_;
  mutable std::mutex mutex_;
  std::mutex sync_mutex_;
  std::optional<TimePoint> last_success_;
  std::atomic<bool> running_{false};
};

}  // namespace wager
