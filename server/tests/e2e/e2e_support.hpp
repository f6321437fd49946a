#pragma once

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "wager/app.hpp"
#include "wager/schema.hpp"

namespace wager_e2e {

inline std::string EnvOr(const char* key, const std::string& fallback) {
  const char* value = std::getenv(key);
  return value ? std::string{value} : fallback;
}

inline wager::AppConfig TestConfig(unsigned short port) {
  wager::AppConfig cfg{};
  cfg.port = port;
  cfg.db_host = EnvOr("DB_HOST", "127.0.0.1");
  cfg.db_port = static_cast<unsigned short>(std::stoi(EnvOr("DB_PORT", "3306")));
  cfg.db_user = EnvOr("DB_USER", "app");
  cfg.db_password = EnvOr("DB_PASSWORD", "app_pass");
  cfg.db_name = EnvOr("DB_NAME", "app_db");
  cfg.log_level = "warn";
  cfg.bet_cutoff_seconds = 300;
  cfg.payout_multiplier_bps = 20000;
  cfg.min_stake_cents = 100;
  cfg.starting_balance_cents = 10000;
  cfg.wagers_page_size = 20;
  cfg.session_ttl_seconds = 3600;
  cfg.feed_url = "";
  cfg.feed_poll_seconds = 0;
  cfg.settlement_sweep_seconds = 0;
  cfg.ops_token = "ops-token";
  return cfg;
}

inline std::int64_t EpochMillisFromNow(std::chrono::seconds offset) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             (std::chrono::system_clock::now() + offset).time_since_epoch())
      .count();
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

inline void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"].contains("timestamp"));
}

inline void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
  EXPECT_TRUE(body["error"]["message"].is_string());
}

// 서버를 같은 프로세스의 스레드에서 띄운다. DB에 연결할 수 없으면 건너뛴다.
class ServerFixture : public ::testing::Test {
 protected:
  explicit ServerFixture(unsigned short port) : config_(TestConfig(port)) {}

  void SetUp() override {
    wager::DbConfig db_cfg;
    db_cfg.host = config_.db_host;
    db_cfg.port = config_.db_port;
    db_cfg.user = config_.db_user;
    db_cfg.password = config_.db_password;
    db_cfg.database = config_.db_name;
    try {
      wager::MariaDbClient db(db_cfg);
      wager::ApplySchema(db);
      wager::ClearAllTables(db);
    } catch (const wager::DbException& ex) {
      GTEST_SKIP() << "MariaDB에 연결할 수 없습니다: " << ex.what();
    }
    app_ = std::make_unique<wager::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target,
                          const nlohmann::json& body = nullptr, const std::string& token = "",
                          const std::string& ops_token = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!body.is_null()) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body.dump();
    }
    req.prepare_payload();
    if (!token.empty()) {
      req.set(boost::beast::http::field::authorization, "Bearer " + token);
    }
    if (!ops_token.empty()) {
      req.set("X-Ops-Token", ops_token);
    }

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target, const std::string& token = "") {
    return Send(boost::beast::http::verb::get, target, nullptr, token);
  }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body, const std::string& token = "") {
    return Send(boost::beast::http::verb::post, target, body, token);
  }

  SimpleHttpResponse Ops(boost::beast::http::verb verb, const std::string& target,
                         const nlohmann::json& body = nullptr) {
    return Send(verb, target, body, "", config_.ops_token);
  }

  std::string OpenSession(const std::string& external_id) {
    auto res = Send(boost::beast::http::verb::post, "/api/session",
                    {{"externalId", external_id}, {"displayName", external_id}}, "", config_.ops_token);
    EXPECT_EQ(res.status, boost::beast::http::status::ok);
    return res.body["data"]["token"].get<std::string>();
  }

  // 2시간 뒤 시작하는 경기를 피드 푸시로 만든다.
  std::int64_t PushScheduledEvent(const std::string& feed_id) {
    auto res = Ops(boost::beast::http::verb::post, "/ops/feed/updates",
                   {{"feedEventId", feed_id},
                    {"status", "scheduled"},
                    {"participantA", "Bears"},
                    {"participantB", "Packers"},
                    {"startsAt", EpochMillisFromNow(std::chrono::hours(2))}});
    EXPECT_EQ(res.status, boost::beast::http::status::created);
    return res.body["data"]["eventId"].get<std::int64_t>();
  }

  wager::AppConfig config_;
  std::unique_ptr<wager::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace wager_e2e
