/*
 * 설명: 외부에서 인증된 사용자에게 베어러 세션 토큰을 발급하고 토큰을 사용자 ID로 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/betting_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "wager/domain.hpp"
#include "wager/ledger.hpp"

namespace wager {

struct Session {
  std::string token;
  std::int64_t user_id{0};
  TimePoint expires_at;
};

class IdentityService {
 public:
  IdentityService(std::shared_ptr<Ledger> ledger, std::chrono::seconds ttl);

  // 처음 보는 external_id면 시작 잔액으로 계정이 만들어진다.
  Session OpenSession(const std::string& external_id, const std::string& display_name);
  std::optional<std::int64_t> Resolve(const std::string& token);
  bool CloseSession(const std::string& token);

  void SetClock(const std::function<TimePoint()>& clock);

 private:
  std::string GenerateToken() const;
  void CleanupExpired(TimePoint now);

  std::shared_ptr<Ledger> ledger_;
  std::chrono::seconds ttl_;
  std::function<TimePoint()> clock_;
  std::unordered_map<std::string, Session> sessions_;
  std::mutex mutex_;
};

}  // namespace wager
