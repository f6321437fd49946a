/*
 * 설명: 잠금 시각 계산과 피드 상태 전이 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_lifecycle_test.cpp
 */
#include "wager/event_lifecycle.hpp"

namespace wager {

TimePoint LockTimeFor(TimePoint starts_at, std::chrono::milliseconds cutoff) { return starts_at - cutoff; }

EventStatus EffectiveStatus(const Event& event, TimePoint now) {
  if (event.stored_status == EventStatus::kScheduled && now >= event.lock_at) {
    return EventStatus::kLocked;
  }
  return event.stored_status;
}

bool IsBettable(const Event& event, TimePoint now) {
  return EffectiveStatus(event, now) == EventStatus::kScheduled && now < event.lock_at;
}

int StatusRank(EventStatus status) {
  switch (status) {
    case EventStatus::kScheduled:
      return 0;
    case EventStatus::kLocked:
      return 1;
    case EventStatus::kInProgress:
      return 2;
    case EventStatus::kFinal:
      return 3;
    case EventStatus::kCancelled:
      return 4;
  }
  return 0;
}

TransitionDecision EvaluateFeedTransition(const Event& current, const FeedSnapshot& next) {
  const EventStatus from = current.stored_status;
  const bool scores_changed = next.score_a != current.score_a || next.score_b != current.score_b;
  const bool rescheduled = next.starts_at.has_value() && *next.starts_at != current.starts_at;

  if (from == EventStatus::kFinal) {
    if (next.status != EventStatus::kFinal) {
      return {TransitionVerdict::kReject, "종료된 경기는 다른 상태로 바뀔 수 없습니다"};
    }
    if (scores_changed) {
      return {TransitionVerdict::kReject, "이미 기록된 최종 결과와 다릅니다"};
    }
    return {TransitionVerdict::kNoop, ""};
  }

  if (from == EventStatus::kCancelled) {
    if (next.status == EventStatus::kCancelled) {
      return {TransitionVerdict::kNoop, ""};
    }
    return {TransitionVerdict::kReject, "취소된 경기는 다른 상태로 바뀔 수 없습니다"};
  }

  if (next.status == EventStatus::kCancelled) {
    return {TransitionVerdict::kApply, ""};
  }

  if (next.status == EventStatus::kFinal && (!next.score_a || !next.score_b)) {
    return {TransitionVerdict::kReject, "최종 상태에는 점수가 필요합니다"};
  }

  int from_rank = StatusRank(from);
  int to_rank = StatusRank(next.status);
  if (to_rank < from_rank) {
    return {TransitionVerdict::kReject, "이전 단계 상태로 되돌릴 수 없습니다"};
  }
  if (to_rank == from_rank && !scores_changed && !(from == EventStatus::kScheduled && rescheduled)) {
    return {TransitionVerdict::kNoop, ""};
  }
  return {TransitionVerdict::kApply, ""};
}

EventOutcome DeriveOutcome(const std::string& participant_a, const std::string& participant_b, int score_a,
                           int score_b) {
  EventOutcome outcome;
  outcome.score_a = score_a;
  outcome.score_b = score_b;
  if (score_a > score_b) {
    outcome.winner = participant_a;
  } else if (score_b > score_a) {
    outcome.winner = participant_b;
  }
  return outcome;
}

}  // namespace wager
