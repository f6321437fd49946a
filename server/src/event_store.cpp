/*
 * 설명: 경기 조회, 베팅 가능 목록, 피드 갱신 반영을 MariaDB 위에서 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/event_store_it_test.cpp
 */
#include "wager/event_store.hpp"

#include <sstream>
#include <utility>

#include "wager/event_lifecycle.hpp"

namespace wager {
namespace {
constexpr const char* kEventColumns =
    "SELECT id, feed_event_id, participant_a, participant_b, starts_at_ms, status, score_a, score_b, winner FROM events";

std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }

std::string NullableInt(const std::optional<int>& value) { return value ? std::to_string(*value) : "NULL"; }
}  // namespace

std::string_view ToString(FeedApplyResult result) {
  switch (result) {
    case FeedApplyResult::kCreated:
      return "created";
    case FeedApplyResult::kApplied:
      return "applied";
    case FeedApplyResult::kNoop:
      return "noop";
    case FeedApplyResult::kRejected:
      return "rejected";
  }
  return "noop";
}

EventStore::EventStore(std::shared_ptr<MariaDbClient> db_client, std::chrono::milliseconds cutoff)
    : db_client_(std::move(db_client)), cutoff_(cutoff) {}

std::optional<Event> EventStore::GetEvent(std::int64_t event_id) const {
  std::optional<Event> event;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kEventColumns << " WHERE id=" << event_id << ";";
    auto res = db_client_->Query(conn, oss.str(), "경기 조회 실패");
    if (MYSQL_ROW row = res.Next()) {
      event = BuildEvent(row);
    }
  });
  return event;
}

std::optional<Event> EventStore::FindByFeedId(const std::string& feed_event_id) const {
  std::optional<Event> event;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kEventColumns << " WHERE feed_event_id='" << db_client_->Escape(conn, feed_event_id) << "';";
    auto res = db_client_->Query(conn, oss.str(), "경기 조회 실패");
    if (MYSQL_ROW row = res.Next()) {
      event = BuildEvent(row);
    }
  });
  return event;
}

std::vector<Event> EventStore::ListBettable(TimePoint as_of) const {
  std::vector<Event> events;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    events.clear();
    std::ostringstream oss;
    oss << kEventColumns << " WHERE status='scheduled' AND starts_at_ms > " << (ToEpochMillis(as_of) + cutoff_.count())
        << " ORDER BY starts_at_ms ASC, id ASC;";
    auto res = db_client_->Query(conn, oss.str(), "베팅 가능 경기 조회 실패");
    MYSQL_ROW row;
    while ((row = res.Next()) != nullptr) {
      Event event = BuildEvent(row);
      if (IsBettable(event, as_of)) {
        events.push_back(std::move(event));
      }
    }
  });
  return events;
}

FeedApplyOutcome EventStore::RecordFeedUpdate(const FeedUpdate& update) {
  FeedApplyOutcome outcome;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kEventColumns << " WHERE feed_event_id='" << db_client_->Escape(conn, update.feed_event_id)
        << "' FOR UPDATE;";
    std::optional<Event> current;
    {
      auto res = db_client_->Query(conn, oss.str(), "피드 대상 경기 잠금 실패");
      if (MYSQL_ROW row = res.Next()) {
        current = BuildEvent(row);
      }
    }
    outcome = current ? ApplyToExisting(conn, *current, update) : InsertFromFeed(conn, update);
    return outcome.result == FeedApplyResult::kCreated || outcome.result == FeedApplyResult::kApplied;
  });
  return outcome;
}

FeedApplyOutcome EventStore::InsertFromFeed(MYSQL* conn, const FeedUpdate& update) {
  FeedApplyOutcome outcome;
  outcome.result = FeedApplyResult::kRejected;
  if (update.feed_event_id.empty() || update.participant_a.empty() || update.participant_b.empty() ||
      update.participant_a == update.participant_b || !update.starts_at) {
    outcome.reason = "신규 경기에 필요한 참가자/시작 시각 정보가 없습니다";
    return outcome;
  }
  if (update.status == EventStatus::kFinal && (!update.score_a || !update.score_b)) {
    outcome.reason = "최종 상태에는 점수가 필요합니다";
    return outcome;
  }

  std::optional<std::string> winner;
  if (update.status == EventStatus::kFinal) {
    winner = DeriveOutcome(update.participant_a, update.participant_b, *update.score_a, *update.score_b).winner;
  }
  std::ostringstream insert;
  insert << "INSERT INTO events(feed_event_id, participant_a, participant_b, starts_at_ms, status, score_a, score_b, "
            "winner, updated_at_ms) VALUES('"
         << db_client_->Escape(conn, update.feed_event_id) << "', '" << db_client_->Escape(conn, update.participant_a)
         << "', '" << db_client_->Escape(conn, update.participant_b) << "', " << ToEpochMillis(*update.starts_at)
         << ", '" << ToString(update.status) << "', " << NullableInt(update.score_a) << ", "
         << NullableInt(update.score_b) << ", "
         << (winner ? "'" + db_client_->Escape(conn, *winner) + "'" : std::string("NULL")) << ", "
         << ToEpochMillis(std::chrono::system_clock::now()) << ");";
  if (mysql_query(conn, insert.str().c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      // 동시 생성 경합: 재시도하면 기존 행 갱신 경로로 들어간다.
      throw DbException("경기 동시 생성 경합", kDuplicateEntry, true);
    }
    db_client_->RaiseError(conn, "경기 생성 실패");
  }
  outcome.result = FeedApplyResult::kCreated;
  outcome.event_id = static_cast<std::int64_t>(mysql_insert_id(conn));
  outcome.previous_status = update.status;
  outcome.current_status = update.status;
  outcome.became_terminal = IsTerminal(update.status);
  return outcome;
}

FeedApplyOutcome EventStore::ApplyToExisting(MYSQL* conn, const Event& current, const FeedUpdate& incoming) {
  FeedApplyOutcome outcome;
  outcome.event_id = current.id;
  outcome.previous_status = current.stored_status;
  outcome.current_status = current.stored_status;

  // 피드가 참가자 순서를 뒤집어 보내면 점수를 저장된 순서로 맞춘다.
  FeedUpdate update = incoming;
  if (!incoming.participant_a.empty() || !incoming.participant_b.empty()) {
    const bool same_order =
        incoming.participant_a == current.participant_a && incoming.participant_b == current.participant_b;
    const bool reversed =
        incoming.participant_a == current.participant_b && incoming.participant_b == current.participant_a;
    if (reversed && !same_order) {
      std::swap(update.score_a, update.score_b);
      std::swap(update.participant_a, update.participant_b);
    } else if (!same_order) {
      outcome.result = FeedApplyResult::kRejected;
      outcome.reason = "피드의 참가자 정보가 저장된 경기와 다릅니다";
      return outcome;
    }
  }

  FeedSnapshot next{update.status, update.score_a, update.score_b, update.starts_at};
  auto decision = EvaluateFeedTransition(current, next);
  if (decision.verdict == TransitionVerdict::kReject) {
    outcome.result = FeedApplyResult::kRejected;
    outcome.reason = decision.reason;
    return outcome;
  }
  if (decision.verdict == TransitionVerdict::kNoop) {
    outcome.result = FeedApplyResult::kNoop;
    return outcome;
  }

  std::optional<std::string> winner;
  if (update.status == EventStatus::kFinal) {
    winner = DeriveOutcome(current.participant_a, current.participant_b, *update.score_a, *update.score_b).winner;
  }
  std::ostringstream oss;
  oss << "UPDATE events SET status='" << ToString(update.status) << "', score_a=" << NullableInt(update.score_a)
      << ", score_b=" << NullableInt(update.score_b) << ", winner="
      << (winner ? "'" + db_client_->Escape(conn, *winner) + "'" : std::string("NULL"));
  if (update.starts_at && update.status == EventStatus::kScheduled) {
    oss << ", starts_at_ms=" << ToEpochMillis(*update.starts_at);
  }
  oss << ", updated_at_ms=" << ToEpochMillis(std::chrono::system_clock::now()) << " WHERE id=" << current.id << ";";
  db_client_->Execute(conn, oss.str(), "경기 상태 갱신 실패");

  outcome.result = FeedApplyResult::kApplied;
  outcome.current_status = update.status;
  outcome.became_terminal = !IsTerminal(current.stored_status) && IsTerminal(update.status);
  return outcome;
}

std::optional<Event> EventStore::GetEventInTx(MYSQL* conn, std::int64_t event_id) const {
  std::ostringstream oss;
  oss << kEventColumns << " WHERE id=" << event_id << " LOCK IN SHARE MODE;";
  auto res = db_client_->Query(conn, oss.str(), "경기 공유 잠금 실패");
  if (MYSQL_ROW row = res.Next()) {
    return BuildEvent(row);
  }
  return std::nullopt;
}

std::vector<std::int64_t> EventStore::ListEventsAwaitingSettlement() const {
  std::vector<std::int64_t> ids;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    ids.clear();
    auto res = db_client_->Query(conn,
                                 "SELECT DISTINCT e.id FROM events e JOIN wagers w ON w.event_id = e.id "
                                 "WHERE e.status IN ('final', 'cancelled') AND w.status = 'pending' ORDER BY e.id;",
                                 "정산 대기 경기 조회 실패");
    MYSQL_ROW row;
    while ((row = res.Next()) != nullptr) {
      ids.push_back(ToInt64(row[0]));
    }
  });
  return ids;
}

Event EventStore::BuildEvent(MYSQL_ROW row) const {
  Event event;
  event.id = ToInt64(row[0]);
  event.feed_event_id = row[1] ? row[1] : "";
  event.participant_a = row[2] ? row[2] : "";
  event.participant_b = row[3] ? row[3] : "";
  event.starts_at = FromEpochMillis(ToInt64(row[4]));
  event.lock_at = LockTimeFor(event.starts_at, cutoff_);
  event.stored_status = ParseEventStatus(row[5] ? row[5] : "").value_or(EventStatus::kScheduled);
  if (row[6]) {
    event.score_a = std::stoi(row[6]);
  }
  if (row[7]) {
    event.score_b = std::stoi(row[7]);
  }
  if (event.stored_status == EventStatus::kFinal && event.score_a && event.score_b) {
    EventOutcome outcome;
    outcome.score_a = *event.score_a;
    outcome.score_b = *event.score_b;
    if (row[8]) {
      outcome.winner = std::string(row[8]);
    }
    event.outcome = outcome;
  }
  return event;
}

}  // namespace wager
