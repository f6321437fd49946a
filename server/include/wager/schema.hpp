/*
 * 설명: 사용자/경기/베팅/원장 테이블을 멱등하게 생성하고 테스트용 초기화를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ledger_it_test.cpp
 */
#pragma once

#include "wager/db_client.hpp"

namespace wager {

void ApplySchema(const MariaDbClient& db_client);
void ClearAllTables(const MariaDbClient& db_client);

}  // namespace wager
