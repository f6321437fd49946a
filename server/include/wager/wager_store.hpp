/*
 * 설명: 베팅 행을 저장/조회하고 Pending 에서만 출발하는 가드된 상태 전이(CAS)를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/betting_it_test.cpp, server/tests/it/settlement_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "wager/db_client.hpp"
#include "wager/domain.hpp"

namespace wager {

class WagerStore {
 public:
  explicit WagerStore(std::shared_ptr<MariaDbClient> db_client);

  // 같은 (user_id, request_id)가 이미 있으면 false를 돌려주고 아무것도 쓰지 않는다.
  bool InsertInTx(MYSQL* conn, Wager& wager) const;
  std::optional<Wager> FindForUpdateInTx(MYSQL* conn, std::int64_t wager_id) const;
  std::optional<Wager> FindByRequestInTx(MYSQL* conn, std::int64_t user_id, const std::string& request_id) const;

  // status='pending' 조건부 UPDATE. 정확히 한 행이 바뀐 경우에만 true.
  bool TransitionFromPendingInTx(MYSQL* conn, std::int64_t wager_id, WagerStatus next, Money realized_payout,
                                 TimePoint settled_at) const;

  std::optional<Wager> Find(std::int64_t wager_id) const;
  std::vector<std::int64_t> ListPendingIdsForEvent(std::int64_t event_id) const;
  WagerPage ListForUser(std::int64_t user_id, std::optional<WagerStatus> status_filter, std::size_t page,
                        std::size_t size) const;

 private:
  Wager BuildWager(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace wager
