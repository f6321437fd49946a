/*
 * 설명: 베팅 채점 규칙과 정산 트랜잭션을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/settlement_grade_test.cpp, server/tests/it/settlement_it_test.cpp
 */
#include "wager/settlement_engine.hpp"

#include <utility>

namespace wager {

std::optional<WagerGrade> GradeWager(const Wager& wager, const Event& event) {
  if (event.stored_status == EventStatus::kCancelled) {
    return WagerGrade{WagerStatus::kCancelled, wager.stake, kReasonEventCancelled};
  }
  if (event.stored_status != EventStatus::kFinal || !event.outcome) {
    return std::nullopt;
  }
  if (event.outcome->IsTie()) {
    return WagerGrade{WagerStatus::kPush, wager.stake, kReasonWagerPush};
  }
  if (*event.outcome->winner == wager.pick) {
    return WagerGrade{WagerStatus::kWon, wager.potential_payout, kReasonWagerWon};
  }
  return WagerGrade{WagerStatus::kLost, 0, ""};
}

SettlementEngine::SettlementEngine(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Ledger> ledger,
                                   std::shared_ptr<EventStore> event_store, std::shared_ptr<WagerStore> wager_store,
                                   std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)), ledger_(std::move(ledger)), event_store_(std::move(event_store)),
      wager_store_(std::move(wager_store)), observability_(std::move(observability)),
      clock_([]() { return std::chrono::system_clock::now(); }) {}

void SettlementEngine::SetClock(const std::function<TimePoint()>& clock) { clock_ = clock; }

SettlementReport SettlementEngine::SettleEvent(std::int64_t event_id) {
  SettlementReport report;
  report.event_id = event_id;
  auto event = event_store_->GetEvent(event_id);
  if (!event || !IsTerminal(event->stored_status)) {
    return report;
  }
  if (event->stored_status == EventStatus::kFinal && !event->outcome) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kError, "settlement_missing_outcome", {{"eventId", event_id}});
    }
    return report;
  }

  for (auto wager_id : wager_store_->ListPendingIdsForEvent(event_id)) {
    ++report.examined;
    try {
      auto applied = SettleWager(wager_id, *event);
      if (!applied) {
        ++report.skipped;
        continue;
      }
      switch (*applied) {
        case WagerStatus::kWon:
          ++report.won;
          break;
        case WagerStatus::kLost:
          ++report.lost;
          break;
        case WagerStatus::kPush:
          ++report.push;
          break;
        case WagerStatus::kCancelled:
          ++report.refunded;
          break;
        case WagerStatus::kPending:
          break;
      }
    } catch (const DbException& ex) {
      // 한 베팅의 실패가 나머지 정산을 막지 않는다. 남은 대기 베팅은 다음 정산에서 다시 처리된다.
      ++report.failed;
      if (observability_) {
        observability_->IncrementSettlementFailure();
        observability_->LogEvent(LogLevel::kError, "settlement_wager_failed",
                                 {{"eventId", event_id}, {"wagerId", wager_id}, {"error", ex.what()}});
      }
    }
  }

  if (observability_) {
    observability_->AddWagersSettled(report.Settled());
    observability_->LogEvent(LogLevel::kInfo, "event_settled",
                             {{"eventId", event_id},
                              {"status", std::string(ToString(event->stored_status))},
                              {"examined", report.examined},
                              {"won", report.won},
                              {"lost", report.lost},
                              {"push", report.push},
                              {"refunded", report.refunded},
                              {"skipped", report.skipped},
                              {"failed", report.failed}});
  }
  return report;
}

std::vector<SettlementReport> SettlementEngine::SettleCompletedEvents() {
  std::vector<SettlementReport> reports;
  for (auto event_id : event_store_->ListEventsAwaitingSettlement()) {
    reports.push_back(SettleEvent(event_id));
  }
  return reports;
}

std::optional<WagerStatus> SettlementEngine::SettleWager(std::int64_t wager_id, const Event& event) {
  std::optional<WagerStatus> applied;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    applied.reset();
    auto wager = wager_store_->FindForUpdateInTx(conn, wager_id);
    if (!wager || wager->status != WagerStatus::kPending) {
      return false;
    }
    auto grade = GradeWager(*wager, event);
    if (!grade) {
      return false;
    }
    if (!wager_store_->TransitionFromPendingInTx(conn, wager_id, grade->status, grade->credit, clock_())) {
      return false;
    }
    if (grade->credit > 0) {
      ServiceError error;
      auto entry =
          ledger_->ApplyDeltaInTx(conn, LedgerDelta{wager->user_id, grade->credit, grade->reason, wager_id}, error);
      if (!entry) {
        throw DbException("정산 입금 실패: " + error.message, 0, false);
      }
    }
    applied = grade->status;
    return true;
  });
  return applied;
}

}  // namespace wager
