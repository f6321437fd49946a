/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/betting_flow_test.cpp, server/tests/e2e/ops_feed_test.cpp
 */
#include "wager/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "wager/http_session.hpp"
#include "wager/schema.hpp"
#include "wager/scoreboard_feed.hpp"

namespace wager {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const ApiServices> services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), services_(std::move(services)) {
    boost::beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    ThrowIf(ec);
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    ThrowIf(ec);
    acceptor_.bind(endpoint, ec);
    ThrowIf(ec);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    ThrowIf(ec);
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  static void ThrowIf(const boost::beast::error_code& ec) {
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const ApiServices> services_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<GameFeed> feed)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  const auto rules = config.Rules();
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  ledger_ = std::make_shared<Ledger>(db_client_, rules.starting_balance);
  event_store_ = std::make_shared<EventStore>(db_client_, rules.cutoff);
  wager_store_ = std::make_shared<WagerStore>(db_client_);
  betting_service_ =
      std::make_shared<BettingService>(db_client_, ledger_, event_store_, wager_store_, rules, observability_);
  settlement_engine_ = std::make_shared<SettlementEngine>(db_client_, ledger_, event_store_, wager_store_, observability_);
  identity_ = std::make_shared<IdentityService>(ledger_, std::chrono::seconds(config.session_ttl_seconds));
  if (!feed && !config.feed_url.empty()) {
    feed = std::make_shared<ScoreboardFeed>(config.feed_url);
  }
  feed_synchronizer_ = std::make_shared<FeedSynchronizer>(ioc_, std::move(feed), event_store_, settlement_engine_,
                                                          observability_,
                                                          std::chrono::seconds(config.feed_poll_seconds),
                                                          std::chrono::seconds(config.settlement_sweep_seconds));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    ApplySchema(*db_client_);
    auto services = std::make_shared<ApiServices>(ApiServices{config_, identity_, ledger_, event_store_,
                                                              betting_service_, settlement_engine_,
                                                              feed_synchronizer_, observability_});
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, std::move(services));
    listener_->Run();
    feed_synchronizer_->Start();
    observability_->LogEvent(LogLevel::kInfo, "server_started",
                             {{"port", config_.port}, {"feedPolling", !config_.feed_url.empty()}});
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->LogEvent(LogLevel::kInfo, "server_stopping", {{"signal", signal_number}});
      feed_synchronizer_->Stop();
      if (listener_) {
        listener_->Stop();
      }
      ioc_.stop();
    });
    RunWorkers();
    ioc_.run();
    Stop();
  } catch (const std::exception& ex) {
    // 스키마 적용이나 포트 바인딩 실패. 호출자는 종료 코드로 판단한다.
    failed_ = true;
    observability_->LogEvent(LogLevel::kError, "server_failed", {{"error", ex.what()}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  feed_synchronizer_->Stop();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace wager
