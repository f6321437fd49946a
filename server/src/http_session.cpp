/*
 * 설명: HTTP 요청을 처리하고 세션/경기/베팅/운영 엔드포인트로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/betting_flow_test.cpp, server/tests/e2e/ops_feed_test.cpp
 */
#include "wager/http_session.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <unordered_map>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace wager {

namespace {

namespace http = boost::beast::http;

constexpr std::size_t kMaxPageSize = 100;
// (page - 1) * size로 계산하는 OFFSET이 넘치지 않는 범위.
constexpr std::size_t kMaxPage = 1'000'000;
constexpr std::size_t kMaxRequestIdLength = 64;

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && eq + 1 <= pair.size()) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::int64_t> ParseId(const std::string& value) {
  if (value.empty() || value.size() > 18 || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  auto parsed = std::stoll(value);
  if (parsed <= 0) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  auto parsed = ParseId(value);
  if (!parsed) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(*parsed);
}

// "/api/wagers/42/cancel"에서 prefix="/api/wagers/", suffix="/cancel"이면 "42".
std::optional<std::string> PathParam(const std::string& path, const std::string& prefix, const std::string& suffix) {
  if (path.size() <= prefix.size() + suffix.size() || path.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  if (path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return std::nullopt;
  }
  auto param = path.substr(prefix.size(), path.size() - prefix.size() - suffix.size());
  if (param.find('/') != std::string::npos) {
    return std::nullopt;
  }
  return param;
}

void Reply(HttpSession::Response& res, http::status status, const nlohmann::json& envelope) {
  auto body = envelope.dump();
  res.result(status);
  res.body() = body;
  res.content_length(body.size());
}

http::status StatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUnknownUser:
    case ErrorCode::kUnknownEvent:
    case ErrorCode::kUnknownWager:
      return http::status::not_found;
    case ErrorCode::kBettingClosed:
    case ErrorCode::kNotCancellable:
      return http::status::conflict;
    case ErrorCode::kInvalidStake:
    case ErrorCode::kInvalidSelection:
      return http::status::bad_request;
    case ErrorCode::kInsufficientFunds:
      return http::status::unprocessable_entity;
    case ErrorCode::kNone:
      break;
  }
  return http::status::internal_server_error;
}

void ReplyServiceError(HttpSession::Response& res, const ServiceError& error) {
  Reply(res, StatusFor(error.code), MakeErrorEnvelope(ToString(error.code), error.message));
}

nlohmann::json ToJson(const SettlementReport& report) {
  return {{"eventId", report.event_id}, {"examined", report.examined}, {"won", report.won},
          {"lost", report.lost},        {"push", report.push},         {"refunded", report.refunded},
          {"skipped", report.skipped},  {"failed", report.failed}};
}

nlohmann::json ToJson(const SyncReport& report) {
  return {{"feedAvailable", report.feed_available}, {"received", report.received},
          {"created", report.created},              {"applied", report.applied},
          {"noop", report.noop},                    {"rejected", report.rejected},
          {"failed", report.failed},                {"settledEvents", report.settled_events}};
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  return {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
          {"wagers",
           {{"placed", snapshot.wagers_placed},
            {"cancelled", snapshot.wagers_cancelled},
            {"settled", snapshot.wagers_settled},
            {"settlementFailures", snapshot.settlement_failures}}},
          {"feed",
           {{"applied", snapshot.feed_updates_applied},
            {"rejected", snapshot.feed_updates_rejected},
            {"failures", snapshot.feed_failures}}}};
}

}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ApiServices> services)
    : stream_(std::move(socket)), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = services_->observability ? services_->observability->NextTraceId() : std::string{};
  request_user_.reset();
  if (services_->observability) {
    services_->observability->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "wagerd");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  try {
    Route(*res, path, query);
  } catch (const nlohmann::json::exception&) {
    Reply(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  } catch (const DbException& ex) {
    if (services_->observability) {
      LogContext ctx;
      ctx.trace_id = trace_id_;
      ctx.name = "storage_failure";
      ctx.level = LogLevel::kError;
      ctx.fields = {{"code", ex.code}, {"retryable", ex.retryable}, {"error", ex.what()}};
      services_->observability->Log(ctx);
    }
    Reply(*res, http::status::service_unavailable,
          MakeErrorEnvelope("storage_unavailable", "저장소를 일시적으로 사용할 수 없습니다"));
  } catch (const std::exception& ex) {
    if (services_->observability) {
      LogContext ctx;
      ctx.trace_id = trace_id_;
      ctx.name = "request_failed";
      ctx.level = LogLevel::kError;
      ctx.fields = {{"error", ex.what()}};
      services_->observability->Log(ctx);
    }
    Reply(*res, http::status::internal_server_error, MakeErrorEnvelope("internal_error", "요청 처리 중 오류가 발생했습니다"));
  }
  SendResponse(res);
}

void HttpSession::Route(Response& res, const std::string& path, const std::string& query) {
  const auto method = req_.method();

  if (method == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (method == http::verb::get && path == "/metrics") {
    return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(services_->observability->Snapshot())));
  }

  if (path.compare(0, 5, "/ops/") == 0) {
    if (!HasOpsToken()) {
      return Reply(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    return HandleOps(res, path);
  }

  // 세션 발급은 인증을 마친 상위 서비스만 호출한다.
  if (method == http::verb::post && path == "/api/session") {
    if (!HasOpsToken()) {
      return Reply(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    auto body_json = nlohmann::json::parse(req_.body());
    if (!body_json.contains("externalId") || !body_json["externalId"].is_string() ||
        body_json["externalId"].get<std::string>().empty()) {
      return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "externalId가 필요합니다"));
    }
    std::string display_name;
    if (body_json.contains("displayName")) {
      display_name = body_json["displayName"].get<std::string>();
    }
    auto session = services_->identity->OpenSession(body_json["externalId"].get<std::string>(), display_name);
    request_user_ = session.user_id;
    nlohmann::json data{
        {"token", session.token}, {"userId", session.user_id}, {"expiresAt", ToEpochMillis(session.expires_at)}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (method == http::verb::get && path == "/api/events") {
    auto now = std::chrono::system_clock::now();
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& event : services_->betting->ListBettable()) {
      entries.push_back(ToJson(event, now));
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope({{"entries", entries}}));
  }

  if (method == http::verb::get) {
    if (auto param = PathParam(path, "/api/events/", "")) {
      auto event_id = ParseId(*param);
      auto event = event_id ? services_->event_store->GetEvent(*event_id) : std::nullopt;
      if (!event) {
        return Reply(res, http::status::not_found,
                     MakeErrorEnvelope(ToString(ErrorCode::kUnknownEvent), "존재하지 않는 경기입니다"));
      }
      return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(*event, std::chrono::system_clock::now())));
    }
  }

  // 이하 경로는 모두 베어러 토큰이 필요하다.
  if (path.compare(0, 5, "/api/") != 0) {
    return Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  auto user_id = ExtractUserId();
  if (!user_id) {
    return Reply(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "인증이 필요합니다"));
  }
  request_user_ = user_id;

  if (method == http::verb::delete_ && path == "/api/session") {
    auto auth_it = req_.find(http::field::authorization);
    services_->identity->CloseSession(ParseBearer(std::string(auth_it->value())));
    return Reply(res, http::status::ok, MakeSuccessEnvelope({{"closed", true}}));
  }

  if (method == http::verb::get && path == "/api/me") {
    auto user = services_->ledger->GetUser(*user_id);
    if (!user) {
      return Reply(res, http::status::not_found,
                   MakeErrorEnvelope(ToString(ErrorCode::kUnknownUser), "존재하지 않는 사용자입니다"));
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(*user)));
  }

  if (method == http::verb::post && path == "/api/wagers") {
    return HandlePlaceWager(res, *user_id);
  }

  if (method == http::verb::get && path == "/api/wagers") {
    auto params = ParseQueryParams(query);
    std::optional<WagerStatus> filter;
    std::size_t page = 1;
    std::size_t size = services_->config.wagers_page_size;
    if (auto it = params.find("status"); it != params.end() && !it->second.empty()) {
      filter = ParseWagerStatus(it->second);
      if (!filter) {
        return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "status 값이 올바르지 않습니다"));
      }
    }
    if (auto it = params.find("page"); it != params.end()) {
      auto parsed = ParsePositiveInt(it->second);
      if (!parsed || *parsed > kMaxPage) {
        return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "page 값이 올바르지 않습니다"));
      }
      page = *parsed;
    }
    if (auto it = params.find("size"); it != params.end()) {
      auto parsed = ParsePositiveInt(it->second);
      if (!parsed) {
        return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "size 값이 올바르지 않습니다"));
      }
      size = std::min(*parsed, kMaxPageSize);
    }
    auto wagers = services_->betting->GetUserWagers(*user_id, filter, page, size);
    return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(wagers, page, size)));
  }

  if (method == http::verb::post) {
    if (auto param = PathParam(path, "/api/wagers/", "/cancel")) {
      auto wager_id = ParseId(*param);
      ServiceError error;
      std::optional<Wager> wager;
      if (!wager_id) {
        error.Set(ErrorCode::kUnknownWager, "베팅을 찾을 수 없습니다");
      } else {
        wager = services_->betting->CancelWager(*user_id, *wager_id, error);
      }
      if (!wager) {
        return ReplyServiceError(res, error);
      }
      return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(*wager)));
    }
  }

  if (method == http::verb::get) {
    if (auto param = PathParam(path, "/api/wagers/", "")) {
      auto wager_id = ParseId(*param);
      auto wager = wager_id ? services_->betting->GetWager(*user_id, *wager_id) : std::nullopt;
      if (!wager) {
        return Reply(res, http::status::not_found,
                     MakeErrorEnvelope(ToString(ErrorCode::kUnknownWager), "베팅을 찾을 수 없습니다"));
      }
      return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(*wager)));
    }
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandlePlaceWager(Response& res, std::int64_t user_id) {
  auto body_json = nlohmann::json::parse(req_.body());
  if (!body_json.contains("eventId") || !body_json["eventId"].is_number_integer() || !body_json.contains("pick") ||
      !body_json["pick"].is_string() || !body_json.contains("stake") || !body_json["stake"].is_number_integer()) {
    return Reply(res, http::status::bad_request,
                 MakeErrorEnvelope("bad_request", "eventId, pick, stake(센트 정수)가 필요합니다"));
  }
  PlaceWagerRequest request;
  request.user_id = user_id;
  request.event_id = body_json["eventId"].get<std::int64_t>();
  request.pick = body_json["pick"].get<std::string>();
  request.stake = body_json["stake"].get<Money>();
  if (body_json.contains("requestId") && !body_json["requestId"].is_null()) {
    auto request_id = body_json["requestId"].get<std::string>();
    if (request_id.empty() || request_id.size() > kMaxRequestIdLength) {
      return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "requestId 길이가 올바르지 않습니다"));
    }
    request.request_id = request_id;
  }

  ServiceError error;
  auto wager = services_->betting->PlaceWager(request, error);
  if (!wager) {
    return ReplyServiceError(res, error);
  }
  Reply(res, http::status::created, MakeSuccessEnvelope(ToJson(*wager)));
}

void HttpSession::HandleOps(Response& res, const std::string& path) {
  const auto method = req_.method();

  if (method == http::verb::get && path == "/ops/status") {
    nlohmann::json data = ToJson(services_->observability->Snapshot());
    auto last_sync = services_->feed_sync ? services_->feed_sync->LastSuccessfulSync() : std::nullopt;
    data["lastFeedSync"] = last_sync ? nlohmann::json(ToEpochMillis(*last_sync)) : nlohmann::json(nullptr);
    data["eventsAwaitingSettlement"] = services_->event_store->ListEventsAwaitingSettlement();
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (method == http::verb::post && path == "/ops/feed/updates") {
    return HandleFeedPush(res);
  }

  if (method == http::verb::post && path == "/ops/feed/sync") {
    auto report = services_->feed_sync->SyncOnce();
    if (!report.feed_available) {
      return Reply(res, http::status::service_unavailable,
                   MakeErrorEnvelope("feed_unavailable", "피드에서 데이터를 가져오지 못했습니다", report.error));
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(report)));
  }

  if (method == http::verb::post && path == "/ops/settlement/sweep") {
    nlohmann::json reports = nlohmann::json::array();
    for (const auto& report : services_->settlement->SettleCompletedEvents()) {
      reports.push_back(ToJson(report));
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope({{"reports", reports}}));
  }

  if (method == http::verb::post) {
    if (auto param = PathParam(path, "/ops/events/", "/settle")) {
      auto event_id = ParseId(*param);
      auto event = event_id ? services_->event_store->GetEvent(*event_id) : std::nullopt;
      if (!event) {
        return Reply(res, http::status::not_found,
                     MakeErrorEnvelope(ToString(ErrorCode::kUnknownEvent), "존재하지 않는 경기입니다"));
      }
      if (!IsTerminal(event->stored_status)) {
        return Reply(res, http::status::conflict,
                     MakeErrorEnvelope("event_not_completed", "종료되거나 취소된 경기만 정산할 수 있습니다"));
      }
      return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(services_->settlement->SettleEvent(*event_id))));
    }
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleFeedPush(Response& res) {
  auto body_json = nlohmann::json::parse(req_.body());
  if (!body_json.contains("feedEventId") || !body_json["feedEventId"].is_string() || !body_json.contains("status") ||
      !body_json["status"].is_string()) {
    return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "feedEventId와 status가 필요합니다"));
  }
  auto status = ParseEventStatus(body_json["status"].get<std::string>());
  if (!status || *status == EventStatus::kLocked) {
    return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "status 값이 올바르지 않습니다"));
  }
  FeedUpdate update;
  update.feed_event_id = body_json["feedEventId"].get<std::string>();
  update.status = *status;
  update.participant_a = body_json.value("participantA", std::string{});
  update.participant_b = body_json.value("participantB", std::string{});
  if (body_json.contains("startsAt") && !body_json["startsAt"].is_null()) {
    update.starts_at = FromEpochMillis(body_json["startsAt"].get<std::int64_t>());
  }
  if (body_json.contains("scoreA") && !body_json["scoreA"].is_null()) {
    update.score_a = body_json["scoreA"].get<int>();
  }
  if (body_json.contains("scoreB") && !body_json["scoreB"].is_null()) {
    update.score_b = body_json["scoreB"].get<int>();
  }

  auto outcome = services_->feed_sync->Ingest(update);
  nlohmann::json data{{"result", std::string(ToString(outcome.result))},
                      {"eventId", outcome.event_id},
                      {"previousStatus", std::string(ToString(outcome.previous_status))},
                      {"currentStatus", std::string(ToString(outcome.current_status))},
                      {"becameTerminal", outcome.became_terminal},
                      {"reason", outcome.reason}};
  if (outcome.result == FeedApplyResult::kRejected) {
    return Reply(res, http::status::conflict, MakeErrorEnvelope("feed_update_rejected", outcome.reason, data));
  }
  Reply(res, outcome.result == FeedApplyResult::kCreated ? http::status::created : http::status::ok,
        MakeSuccessEnvelope(data));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (services_->observability) {
    const auto status = static_cast<unsigned>(res->result_int());
    if (status >= 400) {
      services_->observability->IncrementError();
    }
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.user_id = request_user_;
    ctx.name = "http_request";
    ctx.latency_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count());
    ctx.level = status >= 500 ? LogLevel::kError : LogLevel::kInfo;
    ctx.fields = {{"method", std::string(req_.method_string())}, {"path", std::string(req_.target())}, {"status", status}};
    services_->observability->Log(ctx);
  }
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

std::optional<std::int64_t> HttpSession::ExtractUserId() {
  auto auth_it = req_.find(http::field::authorization);
  if (auth_it == req_.end()) {
    return std::nullopt;
  }
  auto token = ParseBearer(std::string(auth_it->value()));
  if (token.empty()) {
    return std::nullopt;
  }
  return services_->identity->Resolve(token);
}

bool HttpSession::HasOpsToken() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !services_->config.ops_token.empty() && header_token == services_->config.ops_token;
}

std::string HttpSession::ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace wager
