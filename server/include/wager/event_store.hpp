/*
 * 설명: 베팅 대상 경기의 현재 상태를 보관하고 피드 갱신을 단조 증가 규칙으로 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/event_store_it_test.cpp, server/tests/unit/event_lifecycle_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "wager/db_client.hpp"
#include "wager/domain.hpp"

namespace wager {

// 피드가 전달하는 경기 갱신 레코드. 외부 경기 ID가 내부 경기 ID와 1:1로 대응한다.
struct FeedUpdate {
  std::string feed_event_id;
  std::string participant_a;
  std::string participant_b;
  std::optional<TimePoint> starts_at;
  EventStatus status{EventStatus::kScheduled};
  std::optional<int> score_a;
  std::optional<int> score_b;
};

enum class FeedApplyResult { kCreated, kApplied, kNoop, kRejected };

struct FeedApplyOutcome {
  FeedApplyResult result{FeedApplyResult::kNoop};
  std::int64_t event_id{0};
  EventStatus previous_status{EventStatus::kScheduled};
  EventStatus current_status{EventStatus::kScheduled};
  bool became_terminal{false};
  std::string reason;
};

std::string_view ToString(FeedApplyResult result);

class EventStore {
 public:
  EventStore(std::shared_ptr<MariaDbClient> db_client, std::chrono::milliseconds cutoff);

  std::optional<Event> GetEvent(std::int64_t event_id) const;
  std::optional<Event> FindByFeedId(const std::string& feed_event_id) const;
  // Scheduled 이면서 as_of < 잠금 시각인 경기만 돌려준다.
  std::vector<Event> ListBettable(TimePoint as_of) const;
  FeedApplyOutcome RecordFeedUpdate(const FeedUpdate& update);

  // 베팅/취소 트랜잭션에서 경기 행을 공유 잠금으로 읽는다. 피드 갱신(배타 잠금)과 직렬화된다.
  std::optional<Event> GetEventInTx(MYSQL* conn, std::int64_t event_id) const;
  std::vector<std::int64_t> ListEventsAwaitingSettlement() const;

 private:
  Event BuildEvent(MYSQL_ROW row) const;
  FeedApplyOutcome InsertFromFeed(MYSQL* conn, const FeedUpdate& update);
  FeedApplyOutcome ApplyToExisting(MYSQL* conn, const Event& current, const FeedUpdate& incoming);

  std::shared_ptr<MariaDbClient> db_client_;
  std::chrono::milliseconds cutoff_;
};

}  // namespace wager
