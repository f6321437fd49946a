/*
 * 설명: 스코어보드 JSON 엔드포인트를 HTTP(S)로 조회해 FeedUpdate 목록으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/scoreboard_parse_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wager/game_feed.hpp"

namespace wager {

// events[].competitions[0].competitors[]에서 홈 팀을 참가자 A로 둔다. 형식이 맞지 않는 항목은 건너뛴다.
std::vector<FeedUpdate> ParseScoreboard(const nlohmann::json& body);

// 피드 상태 이름(Final, STATUS_FINAL 등). 모르는 이름이면 nullopt.
std::optional<EventStatus> MapFeedStatus(const std::string& name);

// "2024-09-08T17:00Z", "2024-09-08T17:00:00Z" 형식의 UTC 시각.
std::optional<TimePoint> ParseFeedTime(const std::string& text);

class ScoreboardFeed : public GameFeed {
 public:
  explicit ScoreboardFeed(const std::string& url, std::chrono::seconds timeout = std::chrono::seconds(10));

  std::vector<FeedUpdate> Fetch() override;

 private:
  std::string Get() const;

  bool use_ssl_{true};
  std::string host_;
  std::string port_;
  std::string target_;
  std::chrono::seconds timeout_;
};

}  // namespace wager
