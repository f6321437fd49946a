/*
 * 설명: MariaDB 연결, 트랜잭션 재시도 정책, 쿼리 헬퍼를 캡슐화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace wager {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  // 락 대기가 이 시간을 넘으면 1205로 실패하고, 트랜잭션 러너가 재시도한다.
  unsigned int lock_wait_timeout_seconds = 2;
  unsigned int connect_timeout_seconds = 2;
  unsigned int query_timeout_seconds = 5;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

constexpr unsigned int kDuplicateEntry = 1062;

// mysql_store_result 결과를 스코프 종료 시 해제한다.
class StoredResult {
 public:
  explicit StoredResult(MYSQL_RES* res) : res_(res, &mysql_free_result) {}
  MYSQL_ROW Next() { return mysql_fetch_row(res_.get()); }

 private:
  std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> res_;
};

// 연결 하나를 소유한다. 커밋되지 않은 채 해제되면 롤백 후 닫는다.
class ScopedConnection {
 public:
  explicit ScopedConnection(MYSQL* conn) : conn_(conn) {}
  ScopedConnection(const ScopedConnection&) = delete;
  ScopedConnection& operator=(const ScopedConnection&) = delete;
  ~ScopedConnection();

  MYSQL* get() const { return conn_; }
  void MarkOpenTransaction() { in_transaction_ = true; }
  void MarkFinished() { in_transaction_ = false; }

 private:
  MYSQL* conn_;
  bool in_transaction_ = false;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work가 true를 반환하면 커밋, false면 롤백한다. 재시도 시 work는 새 트랜잭션에서 처음부터 다시 실행된다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  std::uint64_t ExecuteUpdate(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  StoredResult Query(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  // 재시도 가능한 DbException이면 새 연결로 attempt를 다시 부른다.
  void RunWithRetry(const std::function<void(std::size_t)>& attempt) const;
  [[noreturn]] void FailConnection(MYSQL* conn, const std::string& ctx) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace wager
