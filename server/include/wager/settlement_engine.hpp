/*
 * 설명: 종료/취소된 경기의 대기 베팅을 채점하고 지급액을 원장에 반영한다. 베팅 단위 트랜잭션이라 중복 실행에 안전하다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/settlement_grade_test.cpp, server/tests/it/settlement_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wager/db_client.hpp"
#include "wager/domain.hpp"
#include "wager/event_store.hpp"
#include "wager/ledger.hpp"
#include "wager/observability.hpp"
#include "wager/wager_store.hpp"

namespace wager {

struct WagerGrade {
  WagerStatus status{WagerStatus::kPending};
  Money credit{0};
  std::string reason;
};

// 종료 상태가 아닌 경기나 점수가 없는 Final 경기면 nullopt.
std::optional<WagerGrade> GradeWager(const Wager& wager, const Event& event);

struct SettlementReport {
  std::int64_t event_id{0};
  std::size_t examined{0};
  std::size_t won{0};
  std::size_t lost{0};
  std::size_t push{0};
  std::size_t refunded{0};
  std::size_t skipped{0};
  std::size_t failed{0};

  std::size_t Settled() const { return won + lost + push + refunded; }
};

class SettlementEngine {
 public:
  SettlementEngine(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Ledger> ledger,
                   std::shared_ptr<EventStore> event_store, std::shared_ptr<WagerStore> wager_store,
                   std::shared_ptr<Observability> observability);

  SettlementReport SettleEvent(std::int64_t event_id);
  // 대기 베팅이 남은 종료/취소 경기를 모두 정산한다. 피드 누락이나 이전 실패를 복구하는 주기 작업용.
  std::vector<SettlementReport> SettleCompletedEvents();

  void SetClock(const std::function<TimePoint()>& clock);

 private:
  std::optional<WagerStatus> SettleWager(std::int64_t wager_id, const Event& event);

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Ledger> ledger_;
  std::shared_ptr<EventStore> event_store_;
  std::shared_ptr<WagerStore> wager_store_;
  std::shared_ptr<Observability> observability_;
  std::function<TimePoint()> clock_;
};

}  // namespace wager
