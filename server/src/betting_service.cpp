/*
 * 설명: 베팅 생성/취소 트랜잭션을 구현한다. 모든 거절은 상태를 바꾸지 않고 롤백된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/betting_it_test.cpp
 */
#include "wager/betting_service.hpp"

#include <limits>
#include <utility>

#include "wager/event_lifecycle.hpp"

namespace wager {

BettingService::BettingService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Ledger> ledger,
                               std::shared_ptr<EventStore> event_store, std::shared_ptr<WagerStore> wager_store,
                               const BettingRules& rules, std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)), ledger_(std::move(ledger)), event_store_(std::move(event_store)),
      wager_store_(std::move(wager_store)), rules_(rules), observability_(std::move(observability)),
      clock_([]() { return std::chrono::system_clock::now(); }) {}

void BettingService::SetClock(const std::function<TimePoint()>& clock) { clock_ = clock; }

TimePoint BettingService::Now() const { return clock_(); }

std::optional<Wager> BettingService::PlaceWager(const PlaceWagerRequest& request, ServiceError& error) {
  std::optional<Wager> result;
  bool replayed = false;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    error.Clear();
    result.reset();
    replayed = false;
    if (request.request_id) {
      if (auto existing = wager_store_->FindByRequestInTx(conn, request.user_id, *request.request_id)) {
        result = existing;
        replayed = true;
        return false;
      }
    }
    Wager wager;
    if (!ValidateAndInsert(conn, request, wager, error)) {
      return false;
    }
    result = wager;
    return true;
  });

  if (observability_) {
    nlohmann::json fields{{"eventId", request.event_id}, {"stake", request.stake}};
    LogContext ctx;
    ctx.user_id = request.user_id;
    if (result) {
      fields["wagerId"] = result->id;
      fields["replayed"] = replayed;
      ctx.name = "wager_placed";
      if (!replayed) {
        observability_->IncrementWagersPlaced();
      }
    } else {
      fields["code"] = std::string(ToString(error.code));
      ctx.name = "wager_rejected";
    }
    ctx.fields = fields;
    observability_->Log(ctx);
  }
  return result;
}

bool BettingService::ValidateAndInsert(MYSQL* conn, const PlaceWagerRequest& request, Wager& wager,
                                       ServiceError& error) const {
  auto event = event_store_->GetEventInTx(conn, request.event_id);
  if (!event) {
    error.Set(ErrorCode::kUnknownEvent, "존재하지 않는 경기입니다");
    return false;
  }
  auto now = Now();
  if (!IsBettable(*event, now)) {
    error.Set(ErrorCode::kBettingClosed, "베팅이 마감된 경기입니다");
    return false;
  }
  if (request.stake <= 0 || request.stake < rules_.min_stake ||
      request.stake > std::numeric_limits<Money>::max() / rules_.payout_multiplier_bps) {
    error.Set(ErrorCode::kInvalidStake, "베팅 금액은 최소 " + FormatMoney(rules_.min_stake) + " 이상이어야 합니다");
    return false;
  }
  if (!event->HasParticipant(request.pick)) {
    error.Set(ErrorCode::kInvalidSelection, "경기 참가 팀 중 하나를 선택해야 합니다");
    return false;
  }
  auto balance = ledger_->LockBalanceInTx(conn, request.user_id);
  if (!balance) {
    error.Set(ErrorCode::kUnknownUser, "존재하지 않는 사용자입니다");
    return false;
  }
  if (*balance < request.stake) {
    error.Set(ErrorCode::kInsufficientFunds, "잔액이 부족합니다");
    return false;
  }

  wager.user_id = request.user_id;
  wager.event_id = event->id;
  wager.pick = request.pick;
  wager.stake = request.stake;
  wager.potential_payout = ApplyMultiplier(request.stake, rules_.payout_multiplier_bps);
  wager.realized_payout = 0;
  wager.status = WagerStatus::kPending;
  wager.placed_at = now;
  wager.request_id = request.request_id;
  if (!wager_store_->InsertInTx(conn, wager)) {
    // 같은 request_id의 동시 요청이 먼저 커밋됐다. 재시도하면 기존 베팅을 찾아 돌려준다.
    throw DbException("요청 ID 동시 경합", kDuplicateEntry, true);
  }
  auto entry = ledger_->ApplyDeltaInTx(conn, LedgerDelta{request.user_id, -request.stake, kReasonWagerPlaced, wager.id},
                                       error);
  return entry.has_value();
}

std::optional<Wager> BettingService::CancelWager(std::int64_t user_id, std::int64_t wager_id, ServiceError& error) {
  std::optional<Wager> result;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    error.Clear();
    result.reset();
    Wager wager;
    if (!RefundPending(conn, user_id, wager_id, wager, error)) {
      return false;
    }
    result = wager;
    return true;
  });

  if (observability_) {
    LogContext ctx;
    ctx.user_id = user_id;
    ctx.name = result ? "wager_cancelled" : "wager_cancel_rejected";
    ctx.fields = {{"wagerId", wager_id}};
    if (result) {
      observability_->IncrementWagersCancelled();
    } else {
      ctx.fields["code"] = std::string(ToString(error.code));
    }
    observability_->Log(ctx);
  }
  return result;
}

bool BettingService::RefundPending(MYSQL* conn, std::int64_t user_id, std::int64_t wager_id, Wager& wager,
                                   ServiceError& error) const {
  auto locked = wager_store_->FindForUpdateInTx(conn, wager_id);
  if (!locked || locked->user_id != user_id) {
    error.Set(ErrorCode::kUnknownWager, "베팅을 찾을 수 없습니다");
    return false;
  }
  if (locked->status != WagerStatus::kPending) {
    error.Set(ErrorCode::kNotCancellable, "대기 중인 베팅만 취소할 수 있습니다");
    return false;
  }
  auto event = event_store_->GetEventInTx(conn, locked->event_id);
  if (!event) {
    throw DbException("베팅이 참조하는 경기가 없습니다", 0, false);
  }
  auto now = Now();
  if (!IsBettable(*event, now)) {
    error.Set(ErrorCode::kBettingClosed, "마감 이후에는 베팅을 취소할 수 없습니다");
    return false;
  }
  if (!wager_store_->TransitionFromPendingInTx(conn, wager_id, WagerStatus::kCancelled, locked->stake, now)) {
    error.Set(ErrorCode::kNotCancellable, "대기 중인 베팅만 취소할 수 있습니다");
    return false;
  }
  auto entry =
      ledger_->ApplyDeltaInTx(conn, LedgerDelta{user_id, locked->stake, kReasonWagerCancelled, wager_id}, error);
  if (!entry) {
    return false;
  }
  wager = *locked;
  wager.status = WagerStatus::kCancelled;
  wager.realized_payout = locked->stake;
  wager.settled_at = now;
  return true;
}

std::vector<Event> BettingService::ListBettable() const { return event_store_->ListBettable(Now()); }

WagerPage BettingService::GetUserWagers(std::int64_t user_id, std::optional<WagerStatus> status_filter,
                                        std::size_t page, std::size_t size) const {
  return wager_store_->ListForUser(user_id, status_filter, page == 0 ? 1 : page, size == 0 ? 1 : size);
}

std::optional<Wager> BettingService::GetWager(std::int64_t user_id, std::int64_t wager_id) const {
  auto wager = wager_store_->Find(wager_id);
  if (!wager || wager->user_id != user_id) {
    return std::nullopt;
  }
  return wager;
}

}  // namespace wager
