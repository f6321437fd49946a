/*
 * 설명: 환경변수에서 서버 설정을 읽고 베팅 규칙으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "wager/config.hpp"

#include <cstdlib>
#include <limits>

namespace wager {

namespace {

std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

// 음수, 소수, 뒤에 붙은 문자를 모두 거부한다.
std::uint64_t ParseUnsigned(const char* key, const char* def, std::uint64_t max) {
  const auto text = GetEnv(key, def);
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigException(key, text);
  }
  try {
    auto value = std::stoull(text);
    if (value > max) {
      throw ConfigException(key, text);
    }
    return value;
  } catch (const std::out_of_range&) {
    throw ConfigException(key, text);
  }
}

// 빈 값은 폴링 비활성화. 그 외에는 http(s) 스킴과 호스트가 있어야 한다.
bool IsValidFeedUrl(const std::string& url) {
  if (url.empty()) {
    return true;
  }
  std::size_t host_start = 0;
  if (url.rfind("https://", 0) == 0) {
    host_start = 8;
  } else if (url.rfind("http://", 0) == 0) {
    host_start = 7;
  } else {
    return false;
  }
  return host_start < url.size() && url[host_start] != '/' && url[host_start] != ':';
}

}  // namespace

BettingRules AppConfig::Rules() const {
  BettingRules rules;
  rules.cutoff = std::chrono::seconds(bet_cutoff_seconds);
  rules.payout_multiplier_bps = payout_multiplier_bps;
  rules.min_stake = min_stake_cents;
  rules.starting_balance = starting_balance_cents;
  return rules;
}

AppConfig LoadConfigFromEnv() {
  constexpr auto kPortMax = std::numeric_limits<unsigned short>::max();
  constexpr auto kMoneyMax = static_cast<std::uint64_t>(std::numeric_limits<Money>::max());

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(ParseUnsigned("SERVER_PORT", "8080", kPortMax));
  cfg.db_host = GetEnv("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(ParseUnsigned("DB_PORT", "3306", kPortMax));
  cfg.db_user = GetEnv("DB_USER", "app");
  cfg.db_password = GetEnv("DB_PASSWORD", "app_pass");
  cfg.db_name = GetEnv("DB_NAME", "app_db");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.bet_cutoff_seconds = static_cast<std::size_t>(ParseUnsigned("BET_CUTOFF_SECONDS", "300", 86400 * 7));
  cfg.payout_multiplier_bps = static_cast<std::int64_t>(ParseUnsigned("PAYOUT_MULTIPLIER_BPS", "20000", 1000000));
  cfg.min_stake_cents = static_cast<Money>(ParseUnsigned("MIN_STAKE_CENTS", "100", kMoneyMax));
  cfg.starting_balance_cents = static_cast<Money>(ParseUnsigned("STARTING_BALANCE_CENTS", "1000000", kMoneyMax));
  cfg.wagers_page_size = static_cast<std::size_t>(ParseUnsigned("WAGERS_PAGE_SIZE", "20", 500));
  cfg.session_ttl_seconds = static_cast<std::size_t>(ParseUnsigned("SESSION_TTL_SECONDS", "604800", 86400 * 365));
  cfg.feed_url = GetEnv("FEED_URL", "https://site.api.espn.com/apis/site/v2/sports/football/nfl/scoreboard");
  cfg.feed_poll_seconds = static_cast<std::size_t>(ParseUnsigned("FEED_POLL_SECONDS", "900", 86400));
  cfg.settlement_sweep_seconds = static_cast<std::size_t>(ParseUnsigned("SETTLEMENT_SWEEP_SECONDS", "1800", 86400));
  cfg.ops_token = GetEnv("OPS_TOKEN", "");

  if (cfg.payout_multiplier_bps < kBasisPointsPerUnit) {
    // 배당이 1.0 미만이면 승리해도 원금보다 적게 돌려받는다.
    throw ConfigException("PAYOUT_MULTIPLIER_BPS", std::to_string(cfg.payout_multiplier_bps));
  }
  if (cfg.min_stake_cents == 0) {
    throw ConfigException("MIN_STAKE_CENTS", "0");
  }
  if (cfg.wagers_page_size == 0) {
    throw ConfigException("WAGERS_PAGE_SIZE", "0");
  }
  if (!IsValidFeedUrl(cfg.feed_url)) {
    throw ConfigException("FEED_URL", cfg.feed_url);
  }
  return cfg;
}

}  // namespace wager
