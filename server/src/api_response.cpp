/*
 * 설명: JSON 응답 엔벨로프와 도메인 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "wager/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "wager/event_lifecycle.hpp"

namespace wager {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

template <typename T>
nlohmann::json OrNull(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", std::string(code)}, {"message", std::string(message)}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToJson(const User& user) {
  return {{"id", user.id},
          {"externalId", user.external_id},
          {"displayName", user.display_name},
          {"balance", user.balance},
          {"createdAt", ToEpochMillis(user.created_at)}};
}

nlohmann::json ToJson(const Event& event, TimePoint now) {
  nlohmann::json j{{"id", event.id},
                   {"feedEventId", event.feed_event_id},
                   {"participantA", event.participant_a},
                   {"participantB", event.participant_b},
                   {"startsAt", ToEpochMillis(event.starts_at)},
                   {"lockAt", ToEpochMillis(event.lock_at)},
                   {"status", std::string(ToString(EffectiveStatus(event, now)))},
                   {"bettable", IsBettable(event, now)},
                   {"scoreA", OrNull(event.score_a)},
                   {"scoreB", OrNull(event.score_b)}};
  if (event.outcome) {
    j["outcome"] = {{"scoreA", event.outcome->score_a},
                    {"scoreB", event.outcome->score_b},
                    {"winner", OrNull(event.outcome->winner)},
                    {"tie", event.outcome->IsTie()}};
  } else {
    j["outcome"] = nullptr;
  }
  return j;
}

nlohmann::json ToJson(const Wager& wager) {
  nlohmann::json j{{"id", wager.id},
                   {"userId", wager.user_id},
                   {"eventId", wager.event_id},
                   {"pick", wager.pick},
                   {"stake", wager.stake},
                   {"potentialPayout", wager.potential_payout},
                   {"realizedPayout", wager.realized_payout},
                   {"status", std::string(ToString(wager.status))},
                   {"placedAt", ToEpochMillis(wager.placed_at)},
                   {"requestId", OrNull(wager.request_id)}};
  j["settledAt"] = wager.settled_at ? nlohmann::json(ToEpochMillis(*wager.settled_at)) : nlohmann::json(nullptr);
  return j;
}

nlohmann::json ToJson(const WagerPage& page, std::size_t page_number, std::size_t page_size) {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& wager : page.entries) {
    entries.push_back(ToJson(wager));
  }
  return {{"total", page.total}, {"page", page_number}, {"size", page_size}, {"entries", entries}};
}

}  // namespace wager
