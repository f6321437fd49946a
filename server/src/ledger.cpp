/*
 * 설명: 사용자 행 잠금(SELECT ... FOR UPDATE) 기반으로 잔액 변동을 직렬화하고 감사 기록을 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp
 */
#include "wager/ledger.hpp"

#include <limits>
#include <sstream>

namespace wager {
namespace {
std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }

std::string NullableId(const std::optional<std::int64_t>& id) { return id ? std::to_string(*id) : "NULL"; }
}  // namespace

Ledger::Ledger(std::shared_ptr<MariaDbClient> db_client, Money starting_balance)
    : db_client_(std::move(db_client)), starting_balance_(starting_balance) {}

User Ledger::EnsureUser(const std::string& external_id, const std::string& display_name) {
  std::optional<User> user;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    user.reset();
    auto now_ms = ToEpochMillis(std::chrono::system_clock::now());
    std::ostringstream upsert;
    upsert << "INSERT INTO users(external_id, display_name, balance, created_at_ms) VALUES('"
           << db_client_->Escape(conn, external_id) << "', '" << db_client_->Escape(conn, display_name) << "', "
           << starting_balance_ << ", " << now_ms << ") ON DUPLICATE KEY UPDATE display_name = VALUES(display_name);";
    // 신규 삽입이면 affected rows가 1이다.
    bool created = db_client_->ExecuteUpdate(conn, upsert.str(), "사용자 보장 실패") == 1;

    std::ostringstream select;
    select << "SELECT id, external_id, display_name, balance, created_at_ms FROM users WHERE external_id='"
           << db_client_->Escape(conn, external_id) << "' FOR UPDATE;";
    auto res = db_client_->Query(conn, select.str(), "사용자 조회 실패");
    MYSQL_ROW row = res.Next();
    if (!row) {
      throw DbException("보장한 사용자가 조회되지 않습니다", 0, false);
    }
    user = BuildUser(row);

    if (created) {
      LedgerEntry opening{0, user->id, starting_balance_, kReasonOpeningBalance, std::nullopt, starting_balance_,
                          FromEpochMillis(now_ms)};
      InsertEntryInTx(conn, opening);
    }
    return true;
  });
  return *user;
}

std::optional<User> Ledger::GetUser(std::int64_t user_id) const {
  std::optional<User> user;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, external_id, display_name, balance, created_at_ms FROM users WHERE id=" << user_id << ";";
    auto res = db_client_->Query(conn, oss.str(), "사용자 조회 실패");
    if (MYSQL_ROW row = res.Next()) {
      user = BuildUser(row);
    }
  });
  return user;
}

std::optional<Money> Ledger::GetBalance(std::int64_t user_id) const {
  auto user = GetUser(user_id);
  if (!user) {
    return std::nullopt;
  }
  return user->balance;
}

std::optional<Money> Ledger::LockBalanceInTx(MYSQL* conn, std::int64_t user_id) const {
  std::ostringstream oss;
  oss << "SELECT balance FROM users WHERE id=" << user_id << " FOR UPDATE;";
  auto res = db_client_->Query(conn, oss.str(), "잔액 잠금 실패");
  MYSQL_ROW row = res.Next();
  if (!row) {
    return std::nullopt;
  }
  return ToInt64(row[0]);
}

std::optional<LedgerEntry> Ledger::ApplyDeltaInTx(MYSQL* conn, const LedgerDelta& delta, ServiceError& error) const {
  auto balance = LockBalanceInTx(conn, delta.user_id);
  if (!balance) {
    error.Set(ErrorCode::kUnknownUser, "존재하지 않는 사용자입니다");
    return std::nullopt;
  }
  if (delta.amount > 0 && *balance > std::numeric_limits<Money>::max() - delta.amount) {
    throw DbException("잔액이 표현 범위를 초과합니다", 0, false);
  }
  Money next = *balance + delta.amount;
  if (next < 0) {
    error.Set(ErrorCode::kInsufficientFunds, "잔액이 부족합니다");
    return std::nullopt;
  }

  std::ostringstream update;
  update << "UPDATE users SET balance=" << next << " WHERE id=" << delta.user_id << ";";
  db_client_->Execute(conn, update.str(), "잔액 갱신 실패");

  LedgerEntry entry{0, delta.user_id, delta.amount, delta.reason, delta.wager_id, next,
                    std::chrono::system_clock::now()};
  InsertEntryInTx(conn, entry);
  return entry;
}

std::optional<Money> Ledger::ApplyDelta(std::int64_t user_id, Money amount, const std::string& reason,
                                        ServiceError& error) {
  std::optional<Money> balance;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    error.Clear();
    balance.reset();
    auto entry = ApplyDeltaInTx(conn, LedgerDelta{user_id, amount, reason, std::nullopt}, error);
    if (!entry) {
      return false;
    }
    balance = entry->balance_after;
    return true;
  });
  return balance;
}

std::vector<LedgerEntry> Ledger::GetAuditTrail(std::int64_t user_id) const {
  std::vector<LedgerEntry> entries;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    entries.clear();
    std::ostringstream oss;
    oss << "SELECT id, user_id, amount, reason, wager_id, balance_after, created_at_ms FROM ledger_entries WHERE user_id="
        << user_id << " ORDER BY id ASC;";
    auto res = db_client_->Query(conn, oss.str(), "감사 기록 조회 실패");
    MYSQL_ROW row;
    while ((row = res.Next()) != nullptr) {
      entries.push_back(BuildEntry(row));
    }
  });
  return entries;
}

void Ledger::InsertEntryInTx(MYSQL* conn, LedgerEntry& entry) const {
  std::ostringstream oss;
  oss << "INSERT INTO ledger_entries(user_id, amount, reason, wager_id, balance_after, created_at_ms) VALUES("
      << entry.user_id << ", " << entry.amount << ", '" << db_client_->Escape(conn, entry.reason) << "', "
      << NullableId(entry.wager_id) << ", " << entry.balance_after << ", " << ToEpochMillis(entry.created_at)
      << ");";
  db_client_->Execute(conn, oss.str(), "감사 기록 저장 실패");
  entry.id = static_cast<std::int64_t>(mysql_insert_id(conn));
}

User Ledger::BuildUser(MYSQL_ROW row) const {
  return User{ToInt64(row[0]), row[1] ? row[1] : "", row[2] ? row[2] : "", ToInt64(row[3]),
              FromEpochMillis(ToInt64(row[4]))};
}

LedgerEntry Ledger::BuildEntry(MYSQL_ROW row) const {
  LedgerEntry entry;
  entry.id = ToInt64(row[0]);
  entry.user_id = ToInt64(row[1]);
  entry.amount = ToInt64(row[2]);
  entry.reason = row[3] ? row[3] : "";
  if (row[4]) {
    entry.wager_id = ToInt64(row[4]);
  }
  entry.balance_after = ToInt64(row[5]);
  entry.created_at = FromEpochMillis(ToInt64(row[6]));
  return entry;
}

}  // namespace wager
