/*
 * 설명: 사용자/경기/베팅/원장 도메인 타입과 상태 문자열 변환, 오류 코드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_lifecycle_test.cpp, server/tests/unit/settlement_grade_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wager/money.hpp"

namespace wager {

using TimePoint = std::chrono::system_clock::time_point;

enum class EventStatus { kScheduled, kLocked, kInProgress, kFinal, kCancelled };

enum class WagerStatus { kPending, kWon, kLost, kPush, kCancelled };

enum class ErrorCode {
  kNone,
  kUnknownUser,
  kUnknownEvent,
  kUnknownWager,
  kBettingClosed,
  kInvalidStake,
  kInvalidSelection,
  kInsufficientFunds,
  kNotCancellable,
};

struct ServiceError {
  ErrorCode code{ErrorCode::kNone};
  std::string message;

  explicit operator bool() const { return code != ErrorCode::kNone; }
  void Set(ErrorCode c, std::string msg) {
    code = c;
    message = std::move(msg);
  }
  void Clear() {
    code = ErrorCode::kNone;
    message.clear();
  }
};

struct User {
  std::int64_t id{0};
  std::string external_id;
  std::string display_name;
  Money balance{0};
  TimePoint created_at{};
};

struct EventOutcome {
  int score_a{0};
  int score_b{0};
  // 비어 있으면 무승부.
  std::optional<std::string> winner;

  bool IsTie() const { return !winner.has_value(); }
};

struct Event {
  std::int64_t id{0};
  std::string feed_event_id;
  std::string participant_a;
  std::string participant_b;
  TimePoint starts_at{};
  TimePoint lock_at{};
  // 저장된 상태. Locked는 저장되지 않고 조회 시점에 계산된다.
  EventStatus stored_status{EventStatus::kScheduled};
  std::optional<int> score_a;
  std::optional<int> score_b;
  std::optional<EventOutcome> outcome;

  bool HasParticipant(const std::string& pick) const { return pick == participant_a || pick == participant_b; }
};

struct Wager {
  std::int64_t id{0};
  std::int64_t user_id{0};
  std::int64_t event_id{0};
  std::string pick;
  Money stake{0};
  Money potential_payout{0};
  Money realized_payout{0};
  WagerStatus status{WagerStatus::kPending};
  TimePoint placed_at{};
  std::optional<TimePoint> settled_at;
  std::optional<std::string> request_id;
};

struct WagerPage {
  std::size_t total{0};
  std::vector<Wager> entries;
};

struct LedgerEntry {
  std::int64_t id{0};
  std::int64_t user_id{0};
  Money amount{0};
  std::string reason;
  std::optional<std::int64_t> wager_id;
  Money balance_after{0};
  TimePoint created_at{};
};

std::string_view ToString(EventStatus status);
std::string_view ToString(WagerStatus status);
std::string_view ToString(ErrorCode code);
std::optional<EventStatus> ParseEventStatus(std::string_view text);
std::optional<WagerStatus> ParseWagerStatus(std::string_view text);

bool IsTerminal(WagerStatus status);
bool IsTerminal(EventStatus status);

std::int64_t ToEpochMillis(TimePoint tp);
TimePoint FromEpochMillis(std::int64_t ms);

}  // namespace wager
