/*
 * 설명: HTTP 연결을 처리하고 세션/경기/베팅 API와 운영(ops) 엔드포인트를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/betting_flow_test.cpp, server/tests/e2e/ops_feed_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "wager/api_response.hpp"
#include "wager/betting_service.hpp"
#include "wager/config.hpp"
#include "wager/event_store.hpp"
#include "wager/feed_synchronizer.hpp"
#include "wager/identity.hpp"
#include "wager/ledger.hpp"
#include "wager/observability.hpp"
#include "wager/settlement_engine.hpp"

namespace wager {

// 리스너가 한 번 만들어 모든 연결이 공유한다.
struct ApiServices {
  AppConfig config;
  std::shared_ptr<IdentityService> identity;
  std::shared_ptr<Ledger> ledger;
  std::shared_ptr<EventStore> event_store;
  std::shared_ptr<BettingService> betting;
  std::shared_ptr<SettlementEngine> settlement;
  std::shared_ptr<FeedSynchronizer> feed_sync;
  std::shared_ptr<Observability> observability;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ApiServices> services);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(Response& res, const std::string& path, const std::string& query);
  void HandleOps(Response& res, const std::string& path);
  void HandlePlaceWager(Response& res, std::int64_t user_id);
  void HandleFeedPush(Response& res);
  void SendResponse(std::shared_ptr<Response> res);
  std::optional<std::int64_t> ExtractUserId();
  bool HasOpsToken() const;
  std::string ParseBearer(const std::string& header_value);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const ApiServices> services_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::int64_t> request_user_;
};

}  // namespace wager
