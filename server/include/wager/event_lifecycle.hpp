/*
 * 설명: 경기 잠금 시각 계산과 피드 상태 전이 규칙을 순수 함수로 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_lifecycle_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "wager/domain.hpp"

namespace wager {

// 잠금 시각 = 시작 시각 - 마감 구간. 경계는 배타적이다(now < lock_at 일 때만 열림).
TimePoint LockTimeFor(TimePoint starts_at, std::chrono::milliseconds cutoff);

// 저장 상태가 Scheduled라도 잠금 시각이 지났으면 Locked로 본다.
EventStatus EffectiveStatus(const Event& event, TimePoint now);

bool IsBettable(const Event& event, TimePoint now);

int StatusRank(EventStatus status);

enum class TransitionVerdict { kApply, kNoop, kReject };

struct FeedSnapshot {
  EventStatus status{EventStatus::kScheduled};
  std::optional<int> score_a;
  std::optional<int> score_b;
  std::optional<TimePoint> starts_at;
};

struct TransitionDecision {
  TransitionVerdict verdict{TransitionVerdict::kNoop};
  std::string reason;
};

// 이미 기록된 상태(current)에 피드 상태(next)를 적용할 수 있는지 판정한다.
// Scheduled -> Locked -> InProgress -> Final 순으로만 전진하고, Cancelled는 Final이 아닌 모든 상태에서 도달 가능하다.
TransitionDecision EvaluateFeedTransition(const Event& current, const FeedSnapshot& next);

EventOutcome DeriveOutcome(const std::string& participant_a, const std::string& participant_b, int score_a,
                           int score_b);

}  // namespace wager
