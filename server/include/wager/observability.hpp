/*
 * 설명: 레벨 기반 구조화 JSON 로그와 베팅/정산/피드 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/betting_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace wager {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  std::string trace_id;
  std::optional<std::int64_t> user_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json fields = nlohmann::json::object();
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t wagers_placed{0};
  std::uint64_t wagers_cancelled{0};
  std::uint64_t wagers_settled{0};
  std::uint64_t settlement_failures{0};
  std::uint64_t feed_updates_applied{0};
  std::uint64_t feed_updates_rejected{0};
  std::uint64_t feed_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementWagersPlaced();
  void IncrementWagersCancelled();
  void AddWagersSettled(std::uint64_t count);
  void IncrementSettlementFailure();
  void IncrementFeedApplied();
  void IncrementFeedRejected();
  void IncrementFeedFailure();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  // 요청과 무관한 백그라운드 작업 로그.
  void LogEvent(LogLevel level, const std::string& name, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> wagers_placed_{0};
  std::atomic<std::uint64_t> wagers_cancelled_{0};
  std::atomic<std::uint64_t> wagers_settled_{0};
  std::atomic<std::uint64_t> settlement_failures_{0};
  std::atomic<std::uint64_t> feed_applied_{0};
  std::atomic<std::uint64_t> feed_rejected_{0};
  std::atomic<std::uint64_t> feed_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace wager
