/*
 * 설명: wagers 테이블 접근과 조건부 상태 전이를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/betting_it_test.cpp, server/tests/it/settlement_it_test.cpp
 */
#include "wager/wager_store.hpp"

#include <limits>
#include <sstream>

namespace wager {
namespace {
constexpr const char* kWagerColumns =
    "SELECT id, user_id, event_id, pick, stake, potential_payout, realized_payout, status, placed_at_ms, "
    "settled_at_ms, request_id FROM wagers";

std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }
}  // namespace

WagerStore::WagerStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

bool WagerStore::InsertInTx(MYSQL* conn, Wager& wager) const {
  std::ostringstream oss;
  oss << "INSERT INTO wagers(user_id, event_id, pick, stake, potential_payout, realized_payout, status, placed_at_ms, "
         "request_id) VALUES("
      << wager.user_id << ", " << wager.event_id << ", '" << db_client_->Escape(conn, wager.pick) << "', "
      << wager.stake << ", " << wager.potential_payout << ", " << wager.realized_payout << ", '"
      << ToString(wager.status) << "', " << ToEpochMillis(wager.placed_at) << ", "
      << (wager.request_id ? "'" + db_client_->Escape(conn, *wager.request_id) + "'" : std::string("NULL")) << ");";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    db_client_->RaiseError(conn, "베팅 저장 실패");
  }
  wager.id = static_cast<std::int64_t>(mysql_insert_id(conn));
  return true;
}

std::optional<Wager> WagerStore::FindForUpdateInTx(MYSQL* conn, std::int64_t wager_id) const {
  std::ostringstream oss;
  oss << kWagerColumns << " WHERE id=" << wager_id << " FOR UPDATE;";
  auto res = db_client_->Query(conn, oss.str(), "베팅 잠금 실패");
  if (MYSQL_ROW row = res.Next()) {
    return BuildWager(row);
  }
  return std::nullopt;
}

std::optional<Wager> WagerStore::FindByRequestInTx(MYSQL* conn, std::int64_t user_id,
                                                   const std::string& request_id) const {
  std::ostringstream oss;
  oss << kWagerColumns << " WHERE user_id=" << user_id << " AND request_id='" << db_client_->Escape(conn, request_id)
      << "';";
  auto res = db_client_->Query(conn, oss.str(), "요청 ID 조회 실패");
  if (MYSQL_ROW row = res.Next()) {
    return BuildWager(row);
  }
  return std::nullopt;
}

bool WagerStore::TransitionFromPendingInTx(MYSQL* conn, std::int64_t wager_id, WagerStatus next,
                                           Money realized_payout, TimePoint settled_at) const {
  std::ostringstream oss;
  oss << "UPDATE wagers SET status='" << ToString(next) << "', realized_payout=" << realized_payout
      << ", settled_at_ms=" << ToEpochMillis(settled_at) << " WHERE id=" << wager_id << " AND status='pending';";
  return db_client_->ExecuteUpdate(conn, oss.str(), "베팅 상태 전이 실패") == 1;
}

std::optional<Wager> WagerStore::Find(std::int64_t wager_id) const {
  std::optional<Wager> wager;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kWagerColumns << " WHERE id=" << wager_id << ";";
    auto res = db_client_->Query(conn, oss.str(), "베팅 조회 실패");
    if (MYSQL_ROW row = res.Next()) {
      wager = BuildWager(row);
    }
  });
  return wager;
}

std::vector<std::int64_t> WagerStore::ListPendingIdsForEvent(std::int64_t event_id) const {
  std::vector<std::int64_t> ids;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    ids.clear();
    std::ostringstream oss;
    oss << "SELECT id FROM wagers WHERE event_id=" << event_id << " AND status='pending' ORDER BY id ASC;";
    auto res = db_client_->Query(conn, oss.str(), "대기 베팅 조회 실패");
    MYSQL_ROW row;
    while ((row = res.Next()) != nullptr) {
      ids.push_back(ToInt64(row[0]));
    }
  });
  return ids;
}

WagerPage WagerStore::ListForUser(std::int64_t user_id, std::optional<WagerStatus> status_filter, std::size_t page,
                                  std::size_t size) const {
  WagerPage page_data;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    page_data = WagerPage{};
    std::ostringstream where;
    where << " WHERE user_id=" << user_id;
    if (status_filter) {
      where << " AND status='" << ToString(*status_filter) << "'";
    }

    {
      auto count_res = db_client_->Query(conn, "SELECT COUNT(*) FROM wagers" + where.str() + ";", "베팅 카운트 실패");
      MYSQL_ROW count_row = count_res.Next();
      page_data.total = count_row && count_row[0] ? static_cast<std::size_t>(std::stoull(count_row[0])) : 0;
    }

    // 범위를 벗어난 페이지는 총 개수만 돌려준다.
    if (page == 0 || size == 0 || page - 1 > std::numeric_limits<std::size_t>::max() / size) {
      return;
    }
    std::size_t offset = (page - 1) * size;
    std::ostringstream query;
    query << kWagerColumns << where.str() << " ORDER BY placed_at_ms DESC, id DESC LIMIT " << size << " OFFSET "
          << offset << ";";
    auto res = db_client_->Query(conn, query.str(), "베팅 내역 조회 실패");
    MYSQL_ROW row;
    while ((row = res.Next()) != nullptr) {
      page_data.entries.push_back(BuildWager(row));
    }
  });
  return page_data;
}

Wager WagerStore::BuildWager(MYSQL_ROW row) const {
  Wager wager;
  wager.id = ToInt64(row[0]);
  wager.user_id = ToInt64(row[1]);
  wager.event_id = ToInt64(row[2]);
  wager.pick = row[3] ? row[3] : "";
  wager.stake = ToInt64(row[4]);
  wager.potential_payout = ToInt64(row[5]);
  wager.realized_payout = ToInt64(row[6]);
  wager.status = ParseWagerStatus(row[7] ? row[7] : "").value_or(WagerStatus::kPending);
  wager.placed_at = FromEpochMillis(ToInt64(row[8]));
  if (row[9]) {
    wager.settled_at = FromEpochMillis(ToInt64(row[9]));
  }
  if (row[10]) {
    wager.request_id = std::string(row[10]);
  }
  return wager;
}

}  // namespace wager
