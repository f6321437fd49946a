/*
 * 설명: 도메인 상태/오류 코드의 문자열 변환과 시각 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "wager/domain.hpp"

namespace wager {

std::string_view ToString(EventStatus status) {
  switch (status) {
    case EventStatus::kScheduled:
      return "scheduled";
    case EventStatus::kLocked:
      return "locked";
    case EventStatus::kInProgress:
      return "in_progress";
    case EventStatus::kFinal:
      return "final";
    case EventStatus::kCancelled:
      return "cancelled";
  }
  return "scheduled";
}

std::string_view ToString(WagerStatus status) {
  switch (status) {
    case WagerStatus::kPending:
      return "pending";
    case WagerStatus::kWon:
      return "won";
    case WagerStatus::kLost:
      return "lost";
    case WagerStatus::kPush:
      return "push";
    case WagerStatus::kCancelled:
      return "cancelled";
  }
  return "pending";
}

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kUnknownUser:
      return "unknown_user";
    case ErrorCode::kUnknownEvent:
      return "unknown_event";
    case ErrorCode::kUnknownWager:
      return "unknown_wager";
    case ErrorCode::kBettingClosed:
      return "betting_closed";
    case ErrorCode::kInvalidStake:
      return "invalid_stake";
    case ErrorCode::kInvalidSelection:
      return "invalid_selection";
    case ErrorCode::kInsufficientFunds:
      return "insufficient_funds";
    case ErrorCode::kNotCancellable:
      return "not_cancellable";
  }
  return "none";
}

std::optional<EventStatus> ParseEventStatus(std::string_view text) {
  for (auto status : {EventStatus::kScheduled, EventStatus::kLocked, EventStatus::kInProgress, EventStatus::kFinal,
                      EventStatus::kCancelled}) {
    if (ToString(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<WagerStatus> ParseWagerStatus(std::string_view text) {
  for (auto status : {WagerStatus::kPending, WagerStatus::kWon, WagerStatus::kLost, WagerStatus::kPush,
                      WagerStatus::kCancelled}) {
    if (ToString(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

bool IsTerminal(WagerStatus status) { return status != WagerStatus::kPending; }

bool IsTerminal(EventStatus status) { return status == EventStatus::kFinal || status == EventStatus::kCancelled; }

std::int64_t ToEpochMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromEpochMillis(std::int64_t ms) {
  return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms))};
}

}  // namespace wager
