#include <gtest/gtest.h>

#include "wager/event_lifecycle.hpp"
#include "wager/settlement_engine.hpp"

namespace {

wager::Wager PendingWager(const std::string& pick, wager::Money stake) {
  wager::Wager w;
  w.id = 7;
  w.user_id = 1;
  w.event_id = 3;
  w.pick = pick;
  w.stake = stake;
  w.potential_payout = wager::ApplyMultiplier(stake, 20000);
  w.status = wager::WagerStatus::kPending;
  return w;
}

wager::Event FinalEvent(int score_a, int score_b) {
  wager::Event event;
  event.id = 3;
  event.participant_a = "Bears";
  event.participant_b = "Packers";
  event.stored_status = wager::EventStatus::kFinal;
  event.score_a = score_a;
  event.score_b = score_b;
  event.outcome = wager::DeriveOutcome(event.participant_a, event.participant_b, score_a, score_b);
  return event;
}

}  // namespace

TEST(SettlementGradeTest, WinnerReceivesPotentialPayout) {
  auto grade = wager::GradeWager(PendingWager("Bears", 4000), FinalEvent(24, 17));
  ASSERT_TRUE(grade.has_value());
  EXPECT_EQ(grade->status, wager::WagerStatus::kWon);
  EXPECT_EQ(grade->credit, 8000);
  EXPECT_EQ(grade->reason, wager::kReasonWagerWon);
}

TEST(SettlementGradeTest, LoserReceivesNothing) {
  auto grade = wager::GradeWager(PendingWager("Packers", 4000), FinalEvent(24, 17));
  ASSERT_TRUE(grade.has_value());
  EXPECT_EQ(grade->status, wager::WagerStatus::kLost);
  EXPECT_EQ(grade->credit, 0);
}

TEST(SettlementGradeTest, TieReturnsStake) {
  auto grade = wager::GradeWager(PendingWager("Packers", 4000), FinalEvent(20, 20));
  ASSERT_TRUE(grade.has_value());
  EXPECT_EQ(grade->status, wager::WagerStatus::kPush);
  EXPECT_EQ(grade->credit, 4000);
  EXPECT_EQ(grade->reason, wager::kReasonWagerPush);
}

TEST(SettlementGradeTest, CancelledEventRefundsStake) {
  auto event = FinalEvent(0, 0);
  event.stored_status = wager::EventStatus::kCancelled;
  event.outcome.reset();
  auto grade = wager::GradeWager(PendingWager("Bears", 2500), event);
  ASSERT_TRUE(grade.has_value());
  EXPECT_EQ(grade->status, wager::WagerStatus::kCancelled);
  EXPECT_EQ(grade->credit, 2500);
  EXPECT_EQ(grade->reason, wager::kReasonEventCancelled);
}

TEST(SettlementGradeTest, NonTerminalEventIsNotGraded) {
  auto event = FinalEvent(10, 3);
  event.stored_status = wager::EventStatus::kInProgress;
  EXPECT_FALSE(wager::GradeWager(PendingWager("Bears", 100), event).has_value());

  auto missing_outcome = FinalEvent(10, 3);
  missing_outcome.outcome.reset();
  EXPECT_FALSE(wager::GradeWager(PendingWager("Bears", 100), missing_outcome).has_value());
}
