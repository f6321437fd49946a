/*
 * 설명: 베팅 생성/취소의 사전 조건을 순서대로 검증하고 원장 차감/환불과 베팅 행 변경을 한 트랜잭션으로 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/betting_it_test.cpp, server/tests/e2e/betting_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wager/config.hpp"
#include "wager/db_client.hpp"
#include "wager/domain.hpp"
#include "wager/event_store.hpp"
#include "wager/ledger.hpp"
#include "wager/observability.hpp"
#include "wager/wager_store.hpp"

namespace wager {

struct PlaceWagerRequest {
  std::int64_t user_id{0};
  std::int64_t event_id{0};
  std::string pick;
  Money stake{0};
  // 클라이언트 재시도 식별자. 같은 사용자가 같은 값으로 다시 요청하면 최초 베팅을 그대로 돌려준다.
  std::optional<std::string> request_id;
};

class BettingService {
 public:
  BettingService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<Ledger> ledger,
                 std::shared_ptr<EventStore> event_store, std::shared_ptr<WagerStore> wager_store,
                 const BettingRules& rules, std::shared_ptr<Observability> observability);

  std::optional<Wager> PlaceWager(const PlaceWagerRequest& request, ServiceError& error);
  std::optional<Wager> CancelWager(std::int64_t user_id, std::int64_t wager_id, ServiceError& error);

  std::vector<Event> ListBettable() const;
  WagerPage GetUserWagers(std::int64_t user_id, std::optional<WagerStatus> status_filter, std::size_t page,
                          std::size_t size) const;
  // 다른 사용자의 베팅이면 존재 여부를 드러내지 않고 nullopt.
  std::optional<Wager> GetWager(std::int64_t user_id, std::int64_t wager_id) const;

  void SetClock(const std::function<TimePoint()>& clock);
  const BettingRules& Rules() const { return rules_; }

 private:
  TimePoint Now() const;
  bool ValidateAndInsert(MYSQL* conn, const PlaceWagerRequest& request, Wager& wager, ServiceError& error) const;
  bool RefundPending(MYSQL* conn, std::int64_t user_id, std::int64_t wager_id, Wager& wager,
                     ServiceError& error) const;

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Ledger> ledger_;
  std::shared_ptr<EventStore> event_store_;
  std::shared_ptr<WagerStore> wager_store_;
  BettingRules rules_;
  std::shared_ptr<Observability> observability_;
  std::function<TimePoint()> clock_;
};

}  // namespace wager
