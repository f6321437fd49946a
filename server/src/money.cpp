/*
 * 설명: 센트 단위 금액 포맷과 배당 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/money_test.cpp
 */
#include "wager/money.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace wager {

Money ApplyMultiplier(Money stake, std::int64_t multiplier_bps) {
  if (stake < 0 || multiplier_bps < 0) {
    throw std::invalid_argument("음수 금액 또는 배당률");
  }
  if (multiplier_bps != 0 && stake > std::numeric_limits<Money>::max() / multiplier_bps) {
    throw std::overflow_error("배당 금액이 표현 범위를 초과합니다");
  }
  return stake * multiplier_bps / kBasisPointsPerUnit;
}

std::string FormatMoney(Money cents) {
  std::ostringstream oss;
  if (cents < 0) {
    oss << '-';
    cents = -cents;
  }
  oss << cents / 100 << '.' << std::setw(2) << std::setfill('0') << cents % 100;
  return oss.str();
}

}  // namespace wager
