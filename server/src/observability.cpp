/*
 * 설명: 구조화 로그 출력과 메트릭 카운터를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "wager/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace wager {
namespace {
std::mutex& SinkMutex() {
  static std::mutex mutex;
  return mutex;
}

std::string_view LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string NowIso() {
  auto now = std::chrono::system_clock::now();
  auto tt = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementWagersPlaced() { wagers_placed_.fetch_add(1); }

void Observability::IncrementWagersCancelled() { wagers_cancelled_.fetch_add(1); }

void Observability::AddWagersSettled(std::uint64_t count) { wagers_settled_.fetch_add(count); }

void Observability::IncrementSettlementFailure() { settlement_failures_.fetch_add(1); }

void Observability::IncrementFeedApplied() { feed_applied_.fetch_add(1); }

void Observability::IncrementFeedRejected() { feed_rejected_.fetch_add(1); }

void Observability::IncrementFeedFailure() { feed_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.wagers_placed = wagers_placed_.load();
  snapshot.wagers_cancelled = wagers_cancelled_.load();
  snapshot.wagers_settled = wagers_settled_.load();
  snapshot.settlement_failures = settlement_failures_.load();
  snapshot.feed_updates_applied = feed_applied_.load();
  snapshot.feed_updates_rejected = feed_rejected_.load();
  snapshot.feed_failures = feed_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json = ctx.fields.is_object() ? ctx.fields : nlohmann::json::object();
  log_json["ts"] = NowIso();
  log_json["level"] = LevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  std::lock_guard<std::mutex> lock(SinkMutex());
  *sink_ << log_json.dump() << std::endl;
}

void Observability::LogEvent(LogLevel level, const std::string& name, const nlohmann::json& fields) const {
  LogContext ctx;
  ctx.name = name;
  ctx.level = level;
  ctx.fields = fields;
  Log(ctx);
}

}  // namespace wager
