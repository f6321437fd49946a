/*
 * 설명: 세션 토큰 발급/검증 구현. 토큰은 메모리에만 있으므로 재시작하면 다시 발급받아야 한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/betting_flow_test.cpp
 */
#include "wager/identity.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <openssl/rand.h>

namespace wager {

namespace {

constexpr std::size_t kTokenBytes = 32;

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

}  // namespace

IdentityService::IdentityService(std::shared_ptr<Ledger> ledger, std::chrono::seconds ttl)
    : ledger_(std::move(ledger)), ttl_(ttl), clock_([]() { return std::chrono::system_clock::now(); }) {}

void IdentityService::SetClock(const std::function<TimePoint()>& clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  clock_ = clock;
}

Session IdentityService::OpenSession(const std::string& external_id, const std::string& display_name) {
  auto user = ledger_->EnsureUser(external_id, display_name.empty() ? external_id : display_name);
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();
  CleanupExpired(now);
  Session session{GenerateToken(), user.id, now + ttl_};
  sessions_[session.token] = session;
  return session;
}

std::optional<std::int64_t> IdentityService::Resolve(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(token);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  if (it->second.expires_at <= clock_()) {
    sessions_.erase(it);
    return std::nullopt;
  }
  return it->second.user_id;
}

bool IdentityService::CloseSession(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(token) > 0;
}

std::string IdentityService::GenerateToken() const {
  std::vector<unsigned char> buffer(kTokenBytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("세션 토큰 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

void IdentityService::CleanupExpired(TimePoint now) {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second.expires_at <= now) {
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace wager
