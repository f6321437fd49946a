/*
 * 설명: MariaDB 연결과 재시도 로직, 쿼리 헬퍼를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 */
#include "wager/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace wager {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

ScopedConnection::~ScopedConnection() {
  if (!conn_) {
    return;
  }
  if (in_transaction_) {
    mysql_rollback(conn_);
  }
  mysql_close(conn_);
}

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout_seconds);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    FailConnection(conn, "연결 실패");
  }
  const std::string session_setup[] = {
      "SET SESSION innodb_lock_wait_timeout=" + std::to_string(config_.lock_wait_timeout_seconds) + ";",
      "SET SESSION TRANSACTION ISOLATION LEVEL READ COMMITTED;",
  };
  for (const auto& sql : session_setup) {
    if (mysql_query(conn, sql.c_str()) != 0) {
      FailConnection(conn, "세션 설정 실패");
    }
  }
  return conn;
}

void MariaDbClient::FailConnection(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  mysql_close(conn);
  throw DbException(message, code, IsRetryable(code));
}

void MariaDbClient::RunWithRetry(const std::function<void(std::size_t)>& attempt_fn) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      attempt_fn(attempt);
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
      Backoff(attempt);
    }
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  bool committed = false;
  RunWithRetry([&](std::size_t) {
    ScopedConnection conn(Connect());
    mysql_autocommit(conn.get(), 0);
    conn.MarkOpenTransaction();
    committed = work(conn.get());
    if (!committed) {
      return;
    }
    if (mysql_commit(conn.get()) != 0) {
      RaiseError(conn.get(), "커밋 실패");
    }
    conn.MarkFinished();
  });
  return committed;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry([&](std::size_t) {
    ScopedConnection conn(Connect());
    work(conn.get());
  });
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
}

std::uint64_t MariaDbClient::ExecuteUpdate(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Execute(conn, sql, ctx);
  return static_cast<std::uint64_t>(mysql_affected_rows(conn));
}

StoredResult MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Execute(conn, sql, ctx);
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  return StoredResult(res);
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace wager
