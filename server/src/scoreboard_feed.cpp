/*
 * 설명: 스코어보드 피드 HTTP(S) 클라이언트와 응답 파서.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/scoreboard_parse_test.cpp
 */
#include "wager/scoreboard_feed.hpp"

#include <cstdio>
#include <unordered_map>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

namespace wager {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

constexpr std::uint64_t kBodyLimit = 8 * 1024 * 1024;

// 1970-01-01 기준 일수. 그레고리력 proleptic 변환.
std::int64_t DaysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::optional<int> ReadScore(const nlohmann::json& competitor) {
  if (!competitor.contains("score")) {
    return std::nullopt;
  }
  const auto& score = competitor.at("score");
  if (score.is_number_integer()) {
    return score.get<int>();
  }
  if (score.is_string()) {
    const auto text = score.get<std::string>();
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 6) {
      return std::nullopt;
    }
    return std::stoi(text);
  }
  return std::nullopt;
}

std::optional<FeedUpdate> ParseEntry(const nlohmann::json& entry) {
  if (!entry.is_object() || !entry.contains("id") || !entry.contains("competitions")) {
    return std::nullopt;
  }
  FeedUpdate update;
  const auto& id = entry.at("id");
  if (id.is_string()) {
    update.feed_event_id = id.get<std::string>();
  } else if (id.is_number_integer()) {
    update.feed_event_id = std::to_string(id.get<std::int64_t>());
  } else {
    return std::nullopt;
  }

  auto status_name = entry.value(nlohmann::json::json_pointer("/status/type/name"), std::string{});
  auto status = MapFeedStatus(status_name);
  if (!status) {
    status = MapFeedStatus(entry.value(nlohmann::json::json_pointer("/status/type/description"), std::string{}));
  }
  if (!status) {
    return std::nullopt;
  }
  update.status = *status;

  if (entry.contains("date") && entry.at("date").is_string()) {
    update.starts_at = ParseFeedTime(entry.at("date").get<std::string>());
  }

  const auto& competitions = entry.at("competitions");
  if (!competitions.is_array() || competitions.empty()) {
    return std::nullopt;
  }
  const auto& competitors = competitions.at(0).value("competitors", nlohmann::json::array());
  if (!competitors.is_array() || competitors.size() != 2) {
    return std::nullopt;
  }

  std::optional<int> home_score;
  std::optional<int> away_score;
  for (const auto& competitor : competitors) {
    auto name = competitor.value(nlohmann::json::json_pointer("/team/displayName"), std::string{});
    if (name.empty()) {
      return std::nullopt;
    }
    if (competitor.value("homeAway", std::string{}) == "home") {
      update.participant_a = name;
      home_score = ReadScore(competitor);
    } else {
      update.participant_b = name;
      away_score = ReadScore(competitor);
    }
  }
  if (update.participant_a.empty() || update.participant_b.empty() || update.participant_a == update.participant_b) {
    return std::nullopt;
  }
  // 시작 전 경기는 피드가 0:0을 보내므로 점수로 취급하지 않는다.
  if (update.status == EventStatus::kInProgress || update.status == EventStatus::kFinal) {
    update.score_a = home_score;
    update.score_b = away_score;
  }
  return update;
}

}  // namespace

std::optional<EventStatus> MapFeedStatus(const std::string& name) {
  static const std::unordered_map<std::string, EventStatus> kMapping{
      {"Scheduled", EventStatus::kScheduled},
      {"STATUS_SCHEDULED", EventStatus::kScheduled},
      {"Postponed", EventStatus::kScheduled},
      {"STATUS_POSTPONED", EventStatus::kScheduled},
      {"In Progress", EventStatus::kInProgress},
      {"Halftime", EventStatus::kInProgress},
      {"STATUS_IN_PROGRESS", EventStatus::kInProgress},
      {"STATUS_HALFTIME", EventStatus::kInProgress},
      {"STATUS_END_PERIOD", EventStatus::kInProgress},
      {"Final", EventStatus::kFinal},
      {"Final/OT", EventStatus::kFinal},
      {"STATUS_FINAL", EventStatus::kFinal},
      {"STATUS_FINAL_OVERTIME", EventStatus::kFinal},
      {"Cancelled", EventStatus::kCancelled},
      {"Canceled", EventStatus::kCancelled},
      {"STATUS_CANCELED", EventStatus::kCancelled},
  };
  auto it = kMapping.find(name);
  if (it == kMapping.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<TimePoint> ParseFeedTime(const std::string& text) {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2u-%2uT%2u:%2u%n", &year, &month, &day, &hour, &minute, &consumed) != 5) {
    return std::nullopt;
  }
  auto rest = text.substr(static_cast<std::size_t>(consumed));
  if (!rest.empty() && rest.front() == ':') {
    int sec_consumed = 0;
    if (std::sscanf(rest.c_str(), ":%2u%n", &second, &sec_consumed) != 1) {
      return std::nullopt;
    }
    rest = rest.substr(static_cast<std::size_t>(sec_consumed));
  }
  if (rest != "Z" || month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }
  const auto days = DaysFromCivil(year, month, day);
  const auto seconds = days * 86400 + static_cast<std::int64_t>(hour) * 3600 + minute * 60 + second;
  return TimePoint{std::chrono::seconds(seconds)};
}

std::vector<FeedUpdate> ParseScoreboard(const nlohmann::json& body) {
  if (!body.is_object() || !body.contains("events") || !body.at("events").is_array()) {
    throw FeedException(FeedErrorKind::kDataInconsistent, "스코어보드 응답에 events 배열이 없습니다");
  }
  std::vector<FeedUpdate> updates;
  for (const auto& entry : body.at("events")) {
    try {
      if (auto update = ParseEntry(entry)) {
        updates.push_back(std::move(*update));
      }
    } catch (const nlohmann::json::exception&) {
      // 항목 단위로 건너뛰고 나머지는 계속 반영한다.
      continue;
    }
  }
  return updates;
}

ScoreboardFeed::ScoreboardFeed(const std::string& url, std::chrono::seconds timeout) : timeout_(timeout) {
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    use_ssl_ = true;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    use_ssl_ = false;
    rest = url.substr(7);
  } else {
    throw std::invalid_argument("피드 URL은 http:// 또는 https://로 시작해야 합니다: " + url);
  }
  auto slash = rest.find('/');
  target_ = slash == std::string::npos ? "/" : rest.substr(slash);
  auto authority = rest.substr(0, slash);
  auto colon = authority.find(':');
  if (colon != std::string::npos) {
    host_ = authority.substr(0, colon);
    port_ = authority.substr(colon + 1);
  } else {
    host_ = authority;
    port_ = use_ssl_ ? "443" : "80";
  }
  if (host_.empty()) {
    throw std::invalid_argument("피드 URL에 호스트가 없습니다: " + url);
  }
}

std::vector<FeedUpdate> ScoreboardFeed::Fetch() {
  auto body = Get();
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& ex) {
    throw FeedException(FeedErrorKind::kDataInconsistent, std::string("피드 응답 JSON 파싱 실패: ") + ex.what());
  }
  return ParseScoreboard(parsed);
}

std::string ScoreboardFeed::Get() const {
  http::request<http::empty_body> req{http::verb::get, target_, 11};
  req.set(http::field::host, host_);
  req.set(http::field::user_agent, "wagerd/1.0");
  req.set(http::field::accept, "application/json");

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kBodyLimit);

  try {
    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const endpoints = resolver.resolve(host_, port_);
    if (use_ssl_) {
      boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
      ssl_ctx.set_default_verify_paths();
      ssl_ctx.set_verify_mode(boost::asio::ssl::verify_peer);
      beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
        throw FeedException(FeedErrorKind::kUnavailable, "TLS SNI 설정 실패");
      }
      beast::get_lowest_layer(stream).expires_after(timeout_);
      beast::get_lowest_layer(stream).connect(endpoints);
      stream.handshake(boost::asio::ssl::stream_base::client);
      http::write(stream, req);
      http::read(stream, buffer, parser);
      beast::error_code ec;
      stream.shutdown(ec);
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(timeout_);
      stream.connect(endpoints);
      http::write(stream, req);
      http::read(stream, buffer, parser);
      beast::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }
  } catch (const beast::system_error& ex) {
    throw FeedException(FeedErrorKind::kUnavailable, std::string("피드 요청 실패: ") + ex.what());
  }

  const auto& res = parser.get();
  if (res.result() != http::status::ok) {
    throw FeedException(FeedErrorKind::kUnavailable,
                        "피드 응답 상태 코드 " + std::to_string(res.result_int()));
  }
  return res.body();
}

}  // namespace wager
