/*
 * 설명: 사용자 잔액을 보관하고 부호 있는 금액 변동을 원자적으로 적용하며 감사 기록을 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "wager/db_client.hpp"
#include "wager/domain.hpp"

namespace wager {

inline constexpr const char* kReasonOpeningBalance = "opening_balance";
inline constexpr const char* kReasonWagerPlaced = "wager_placed";
inline constexpr const char* kReasonWagerCancelled = "wager_cancelled";
inline constexpr const char* kReasonWagerWon = "wager_won";
inline constexpr const char* kReasonWagerPush = "wager_push";
inline constexpr const char* kReasonEventCancelled = "event_cancelled";

struct LedgerDelta {
  std::int64_t user_id;
  Money amount;
  std::string reason;
  std::optional<std::int64_t> wager_id;
};

class Ledger {
 public:
  Ledger(std::shared_ptr<MariaDbClient> db_client, Money starting_balance);

  // 처음 보는 외부 ID면 시작 잔액으로 계정을 만들고, 이미 있으면 표시 이름만 갱신한다.
  User EnsureUser(const std::string& external_id, const std::string& display_name);
  std::optional<User> GetUser(std::int64_t user_id) const;
  std::optional<Money> GetBalance(std::int64_t user_id) const;

  // 사용자 행을 잠그고 현재 잔액을 돌려준다. 같은 트랜잭션의 이후 변동과 직렬화된다.
  std::optional<Money> LockBalanceInTx(MYSQL* conn, std::int64_t user_id) const;

  // 실패(UnknownUser, InsufficientFunds) 시 아무것도 쓰지 않고 nullopt를 돌려준다.
  std::optional<LedgerEntry> ApplyDeltaInTx(MYSQL* conn, const LedgerDelta& delta, ServiceError& error) const;

  // 자체 트랜잭션으로 변동을 적용하고 새 잔액을 돌려준다.
  std::optional<Money> ApplyDelta(std::int64_t user_id, Money amount, const std::string& reason, ServiceError& error);

  std::vector<LedgerEntry> GetAuditTrail(std::int64_t user_id) const;

 private:
  User BuildUser(MYSQL_ROW row) const;
  LedgerEntry BuildEntry(MYSQL_ROW row) const;
  void InsertEntryInTx(MYSQL* conn, LedgerEntry& entry) const;

  std::shared_ptr<MariaDbClient> db_client_;
  Money starting_balance_;
};

}  // namespace wager
