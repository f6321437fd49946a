/*
 * 설명: 서버 환경설정 로딩과 베팅 규칙 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/betting_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "wager/money.hpp"

namespace wager {

struct BettingRules {
  std::chrono::milliseconds cutoff{std::chrono::minutes(5)};
  std::int64_t payout_multiplier_bps{20000};
  Money min_stake{100};
  Money starting_balance{1000000};
};

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::size_t bet_cutoff_seconds;
  std::int64_t payout_multiplier_bps;
  Money min_stake_cents;
  Money starting_balance_cents;
  std::size_t wagers_page_size;
  std::size_t session_ttl_seconds;
  std::string feed_url;
  std::size_t feed_poll_seconds;
  std::size_t settlement_sweep_seconds;
  std::string ops_token;

  BettingRules Rules() const;
};

class ConfigException : public std::runtime_error {
 public:
  ConfigException(const std::string& key, const std::string& value)
      : std::runtime_error("설정값이 올바르지 않습니다: " + key + "=" + value), key(key) {}
  std::string key;
};

AppConfig LoadConfigFromEnv();

}  // namespace wager
