/*
 * 설명: HTTP 요청을 상태/정보/메트릭 엔드포인트로 분기하고 WS 업그레이드 시 연결 ID를 발급한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "focusroom/http_session.hpp"

#include <chrono>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "focusroom/websocket_session.hpp"

namespace focusroom {

namespace {
constexpr const char* kServerName = "focusroom";
constexpr const char* kVersion = "v1.0.0";
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<RoomService> room_service,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)),
      room_service_(std::move(room_service)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    return SendJson(http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", kVersion}}));
  }

  if (req_.method() == http::verb::get && path == "/api/info") {
    const auto& settings = room_service_->GetSettings();
    const auto& scoring = room_service_->GetRegistry()->Scoring();
    nlohmann::json data{{"name", kServerName},
                        {"version", kVersion},
                        {"room",
                         {{"focusDurationSeconds", settings.focus_duration.count()},
                          {"breakDurationSeconds", settings.break_duration.count()},
                          {"baseRatePerSecond", scoring.base_rate_per_second},
                          {"penaltyPerDistracted", scoring.penalty_per_distracted},
                          {"metricsIntervalMs", config_.metrics_interval_ms}}}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot =
        observability_->Snapshot(room_service_->GetRegistry()->Size(), room_service_->GetSessions()->Size());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"rooms", {{"active", snapshot.active_rooms}}},
                        {"sessions", {{"active", snapshot.active_sessions}}},
                        {"broadcast", {{"failures", snapshot.broadcast_failures}, {"ticks", snapshot.metrics_ticks}}}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& body) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{.trace_id = trace_id_,
                                   .connection_id = std::nullopt,
                                   .room_code = std::nullopt,
                                   .name = std::string(req_.target()),
                                   .latency_ms = latency,
                                   .detail = {{"status", res->result_int()}}});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    auto connection_id = GenerateConnectionId();
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), std::move(connection_id), coordinator_, room_service_,
                                       observability_, config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kWarn, "connection.upgrade.failed", std::nullopt, std::nullopt,
                               {{"error", ex.what()}});
    }
    boost::beast::error_code ec;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
}

}  // namespace focusroom
