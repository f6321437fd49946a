/*
 * 설명: 외부 경기 데이터 피드 추상화. 동기화기는 이 인터페이스만 알고, 테스트는 스크립트 피드를 주입한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/feed_sync_it_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "wager/event_store.hpp"

namespace wager {

enum class FeedErrorKind { kUnavailable, kDataInconsistent };

class FeedException : public std::runtime_error {
 public:
  FeedException(FeedErrorKind kind, const std::string& message) : std::runtime_error(message), kind(kind) {}
  FeedErrorKind kind;
};

class GameFeed {
 public:
  virtual ~GameFeed() = default;
  // 피드에 접근할 수 없으면 FeedException(kUnavailable)을 던진다.
  virtual std::vector<FeedUpdate> Fetch() = 0;
};

}  // namespace wager
