/*
 * 설명: 서버 전체 수명주기를 관리한다. 저장소/서비스를 조립하고 HTTP 리스너와 피드 동기화 타이머를 구동한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/betting_flow_test.cpp, server/tests/e2e/ops_feed_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "wager/betting_service.hpp"
#include "wager/config.hpp"
#include "wager/db_client.hpp"
#include "wager/event_store.hpp"
#include "wager/feed_synchronizer.hpp"
#include "wager/game_feed.hpp"
#include "wager/identity.hpp"
#include "wager/ledger.hpp"
#include "wager/observability.hpp"
#include "wager/settlement_engine.hpp"
#include "wager/wager_store.hpp"

namespace wager {

class Listener;

class ServerApp {
 public:
  // feed를 넘기지 않으면 config.feed_url로 스코어보드 피드를 만든다. URL이 비어 있으면 폴링하지 않는다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<GameFeed> feed = nullptr);
  ~ServerApp();

  void Run();
  void Stop();
  bool Failed() const { return failed_; }

  std::shared_ptr<Ledger> GetLedger() { return ledger_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<Ledger> ledger_;
  std::shared_ptr<EventStore> event_store_;
  std::shared_ptr<WagerStore> wager_store_;
  std::shared_ptr<BettingService> betting_service_;
  std::shared_ptr<SettlementEngine> settlement_engine_;
  std::shared_ptr<FeedSynchronizer> feed_synchronizer_;
  std::shared_ptr<IdentityService> identity_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<bool> failed_{false};
};

}  // namespace wager
