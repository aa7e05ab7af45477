#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "focusroom/app.hpp"

namespace {

focusroom::AppConfig TestConfig(unsigned short port) {
  focusroom::AppConfig cfg{};
  cfg.port = port;
  cfg.log_level = "warn";
  cfg.focus_duration_seconds = 1;
  cfg.break_duration_seconds = 1;
  cfg.base_rate_per_second = 10.0;
  cfg.penalty_per_distracted = 0.1;
  cfg.metrics_interval_ms = 200;
  cfg.ws_queue_limit_messages = 64;
  cfg.ws_queue_limit_bytes = 262144;
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  EXPECT_TRUE(body["error"].is_null());
  EXPECT_TRUE(body["meta"].is_object());
}

void ExpectWsEventEnvelope(const nlohmann::json& msg, const std::string& event_name) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "event");
  EXPECT_TRUE(msg["seq"].is_number_unsigned());
  EXPECT_EQ(msg["event"], event_name);
  EXPECT_TRUE(msg["p"].is_object());
}

class RoomFlowFixture : public ::testing::Test {
 protected:
  using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  void SetUp() override {
    config_ = TestConfig(18091);
    app_ = std::make_unique<focusroom::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Get(const std::string& target) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  std::unique_ptr<WebSocket> ConnectWs() {
    auto ws = std::make_unique<WebSocket>(ioc_);
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    ws->next_layer().connect(results);
    ws->handshake("localhost", "/ws");
    return ws;
  }

  nlohmann::json ReadWs(WebSocket& ws, boost::beast::flat_buffer& buffer) {
    buffer.consume(buffer.size());
    ws.read(buffer);
    return nlohmann::json::parse(boost::beast::buffers_to_string(buffer.cdata()));
  }

  // 주기 전파 메시지가 섞여 오므로 원하는 이벤트가 나올 때까지 건너뛴다.
  nlohmann::json ReadUntil(WebSocket& ws, boost::beast::flat_buffer& buffer, const std::string& event) {
    for (int i = 0; i < 200; ++i) {
      auto msg = ReadWs(ws, buffer);
      if (msg.value("event", nlohmann::json()) == event) {
        return msg;
      }
    }
    ADD_FAILURE() << "이벤트를 받지 못했습니다: " << event;
    return nlohmann::json::object();
  }

  void Send(WebSocket& ws, const std::string& event, const nlohmann::json& payload, std::uint64_t seq = 1) {
    nlohmann::json msg{{"t", "event"}, {"seq", seq}, {"event", event}, {"p", payload}};
    ws.text(true);
    ws.write(boost::asio::buffer(msg.dump()));
  }

  focusroom::AppConfig config_;
  std::unique_ptr<focusroom::ServerApp> app_;
  std::thread server_thread_;
  boost::asio::io_context ioc_;
};

}  // namespace

TEST_F(RoomFlowFixture, HealthInfoAndMetricsEndpoints) {
  auto health = Get("/api/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(health.body);
  EXPECT_EQ(health.body["data"]["status"], "ok");

  auto info = Get("/api/info");
  ASSERT_EQ(info.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(info.body);
  EXPECT_EQ(info.body["data"]["room"]["focusDurationSeconds"], 1);
  EXPECT_DOUBLE_EQ(info.body["data"]["room"]["baseRatePerSecond"].get<double>(), 10.0);

  auto metrics = Get("/metrics");
  ASSERT_EQ(metrics.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(metrics.body);
  EXPECT_GE(metrics.body["data"]["requests"]["total"].get<std::uint64_t>(), 2u);
  EXPECT_EQ(metrics.body["data"]["rooms"]["active"], 0);

  auto missing = Get("/api/unknown");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  EXPECT_FALSE(missing.body["success"].get<bool>());
  EXPECT_EQ(missing.body["error"]["code"], "not_found");
}

TEST_F(RoomFlowFixture, JoinTimerAndLeaveFlow) {
  auto ws_a = ConnectWs();
  auto ws_b = ConnectWs();
  boost::beast::flat_buffer buf_a;
  boost::beast::flat_buffer buf_b;

  auto ready_a = ReadWs(*ws_a, buf_a);
  ExpectWsEventEnvelope(ready_a, "connection:ready");
  EXPECT_EQ(ready_a["p"]["connectionId"].get<std::string>().size(), 32u);
  ExpectWsEventEnvelope(ReadWs(*ws_b, buf_b), "connection:ready");

  Send(*ws_a, "room:join", {{"roomCode", "STUDY"}, {"displayName", "alice"}});
  auto state_a = ReadUntil(*ws_a, buf_a, "room:state");
  EXPECT_EQ(state_a["p"]["hostDisplayName"], "alice");

  Send(*ws_b, "room:join", {{"roomCode", "STUDY"}, {"username", "bob"}, {"avatarUrl", "bob.glb"}});
  auto state_b = ReadUntil(*ws_b, buf_b, "room:state");
  EXPECT_EQ(state_b["p"]["participants"].size(), 2u);
  auto joined = ReadUntil(*ws_a, buf_a, "user:joined");
  EXPECT_EQ(joined["p"]["displayName"], "bob");
  EXPECT_EQ(joined["p"]["avatarRef"], "bob.glb");

  Send(*ws_a, "timer:start", {{"phase", "focus"}});
  auto started = ReadUntil(*ws_b, buf_b, "timer:started");
  EXPECT_EQ(started["p"]["phase"], "focus");
  EXPECT_TRUE(started["p"]["endTimestamp"].is_number_integer());
  auto ended = ReadUntil(*ws_b, buf_b, "timer:ended");
  EXPECT_EQ(ended["p"]["phase"], "focus");

  Send(*ws_b, "user:distracted", nlohmann::json::object());
  auto status = ReadUntil(*ws_a, buf_a, "user:status-changed");
  EXPECT_EQ(status["p"]["displayName"], "bob");
  EXPECT_TRUE(status["p"]["isDistracted"].get<bool>());

  Send(*ws_a, "room:leave", {{"roomCode", "STUDY"}});
  auto metrics = ReadUntil(*ws_a, buf_a, "user:metrics");
  EXPECT_EQ(metrics["p"]["displayName"], "alice");
  EXPECT_TRUE(metrics["p"].contains("focusPercentage"));
  auto left = ReadUntil(*ws_b, buf_b, "user:left");
  EXPECT_EQ(left["p"]["displayName"], "alice");
  auto after_leave = ReadUntil(*ws_b, buf_b, "room:state");
  EXPECT_EQ(after_leave["p"]["hostDisplayName"], "bob");

  ws_b->close(boost::beast::websocket::close_code::normal);
  for (int i = 0; i < 20 && app_->GetRegistry()->Size() > 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  EXPECT_EQ(app_->GetRegistry()->Size(), 0u);
  EXPECT_EQ(app_->GetSessions()->Size(), 0u);
}

TEST_F(RoomFlowFixture, MalformedFrameGetsBadRequest) {
  auto ws = ConnectWs();
  boost::beast::flat_buffer buffer;
  ExpectWsEventEnvelope(ReadWs(*ws, buffer), "connection:ready");

  ws->text(true);
  ws->write(boost::asio::buffer(std::string("not-json")));
  auto error = ReadWs(*ws, buffer);
  EXPECT_EQ(error["t"], "error");
  EXPECT_EQ(error["p"]["code"], "bad_request");

  ws->write(boost::asio::buffer(std::string(R"({"seq":3})")));
  auto second = ReadWs(*ws, buffer);
  EXPECT_EQ(second["t"], "error");
  EXPECT_EQ(second["p"]["code"], "bad_request");
}

TEST_F(RoomFlowFixture, PeriodicMetricsReachRoomMembers) {
  auto ws = ConnectWs();
  boost::beast::flat_buffer buffer;
  ExpectWsEventEnvelope(ReadWs(*ws, buffer), "connection:ready");
  Send(*ws, "room:join", {{"roomCode", "SOLO"}, {"displayName", "carol"}});
  ReadUntil(*ws, buffer, "room:state");

  auto first = ReadUntil(*ws, buffer, "group:score-updated");
  auto second = ReadUntil(*ws, buffer, "group:score-updated");
  EXPECT_GE(second["p"]["groupScore"].get<double>(), first["p"]["groupScore"].get<double>());
  ExpectWsEventEnvelope(ReadUntil(*ws, buffer, "group:dps-updated"), "group:dps-updated");

  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.body["data"]["rooms"]["active"], 1);
  EXPECT_EQ(metrics.body["data"]["sessions"]["active"], 1);
  EXPECT_GE(metrics.body["data"]["broadcast"]["ticks"].get<std::uint64_t>(), 1u);
  EXPECT_GE(app_->GetMetricsBroadcaster()->TickCount(), 1u);
  EXPECT_EQ(app_->GetCoordinator()->ChannelSize("SOLO"), 1u);
}
