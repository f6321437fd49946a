/*
 * 설명: 센트 단위 고정소수점 금액과 배당 계산을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/money_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>

namespace wager {

// 금액은 항상 센트 단위 정수로 다룬다.
using Money = std::int64_t;

constexpr std::int64_t kBasisPointsPerUnit = 10000;

Money ApplyMultiplier(Money stake, std::int64_t multiplier_bps);
std::string FormatMoney(Money cents);

}  // namespace wager
