/*
 * 설명: 테이블 DDL을 보관하고 적용한다. 시각 컬럼은 모두 epoch 밀리초(BIGINT)다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "wager/schema.hpp"

namespace wager {
namespace {
constexpr const char* kCreateUsers =
    "CREATE TABLE IF NOT EXISTS users ("
    " id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " external_id VARCHAR(64) NOT NULL,"
    " display_name VARCHAR(64) NOT NULL DEFAULT '',"
    " balance BIGINT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " UNIQUE KEY uq_users_external (external_id),"
    " CONSTRAINT ck_users_balance CHECK (balance >= 0)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";

constexpr const char* kCreateEvents =
    "CREATE TABLE IF NOT EXISTS events ("
    " id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " feed_event_id VARCHAR(64) NOT NULL,"
    " participant_a VARCHAR(64) NOT NULL,"
    " participant_b VARCHAR(64) NOT NULL,"
    " starts_at_ms BIGINT NOT NULL,"
    " status VARCHAR(16) NOT NULL,"
    " score_a INT NULL,"
    " score_b INT NULL,"
    " winner VARCHAR(64) NULL,"
    " updated_at_ms BIGINT NOT NULL,"
    " UNIQUE KEY uq_events_feed (feed_event_id),"
    " KEY ix_events_status_start (status, starts_at_ms)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";

constexpr const char* kCreateWagers =
    "CREATE TABLE IF NOT EXISTS wagers ("
    " id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " user_id BIGINT NOT NULL,"
    " event_id BIGINT NOT NULL,"
    " pick VARCHAR(64) NOT NULL,"
    " stake BIGINT NOT NULL,"
    " potential_payout BIGINT NOT NULL,"
    " realized_payout BIGINT NOT NULL DEFAULT 0,"
    " status VARCHAR(16) NOT NULL,"
    " placed_at_ms BIGINT NOT NULL,"
    " settled_at_ms BIGINT NULL,"
    " request_id VARCHAR(64) NULL,"
    " UNIQUE KEY uq_wagers_request (user_id, request_id),"
    " KEY ix_wagers_event_status (event_id, status),"
    " KEY ix_wagers_user_placed (user_id, placed_at_ms),"
    " CONSTRAINT fk_wagers_user FOREIGN KEY (user_id) REFERENCES users(id),"
    " CONSTRAINT fk_wagers_event FOREIGN KEY (event_id) REFERENCES events(id),"
    " CONSTRAINT ck_wagers_stake CHECK (stake > 0)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";

constexpr const char* kCreateLedgerEntries =
    "CREATE TABLE IF NOT EXISTS ledger_entries ("
    " id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " user_id BIGINT NOT NULL,"
    " amount BIGINT NOT NULL,"
    " reason VARCHAR(32) NOT NULL,"
    " wager_id BIGINT NULL,"
    " balance_after BIGINT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " KEY ix_ledger_user (user_id, id),"
    " CONSTRAINT fk_ledger_user FOREIGN KEY (user_id) REFERENCES users(id)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";
}  // namespace

void ApplySchema(const MariaDbClient& db_client) {
  db_client.WithConnectionRetry([&](MYSQL* conn) {
    db_client.Execute(conn, kCreateUsers, "users 테이블 생성 실패");
    db_client.Execute(conn, kCreateEvents, "events 테이블 생성 실패");
    db_client.Execute(conn, kCreateWagers, "wagers 테이블 생성 실패");
    db_client.Execute(conn, kCreateLedgerEntries, "ledger_entries 테이블 생성 실패");
  });
}

void ClearAllTables(const MariaDbClient& db_client) {
  db_client.WithConnectionRetry([&](MYSQL* conn) {
    db_client.Execute(conn, "DELETE FROM ledger_entries;", "원장 초기화 실패");
    db_client.Execute(conn, "DELETE FROM wagers;", "베팅 초기화 실패");
    db_client.Execute(conn, "DELETE FROM events;", "경기 초기화 실패");
    db_client.Execute(conn, "DELETE FROM users;", "사용자 초기화 실패");
  });
}

}  // namespace wager
