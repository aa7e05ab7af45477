/*
 * 설명: WebSocket 연결의 메시지 처리, 백프레셔 및 룸 이벤트 전달을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "focusroom/api_response.hpp"
#include "focusroom/observability.hpp"
#include "focusroom/realtime.hpp"
#include "focusroom/room_service.hpp"

namespace focusroom {

class WebSocketSession : public ConnectionSink, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string connection_id,
                   std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<RoomService> room_service,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 룸 스트랜드 등 임의의 스레드에서 호출될 수 있다.
  bool Deliver(const std::string& event, const nlohmann::json& payload) override;
  const std::string& ConnectionId() const { return connection_id_; }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void Dispatch(const WsEnvelope& env);
  void HandleJoin(const nlohmann::json& payload, std::uint64_t seq);
  void HandleLeave(const nlohmann::json& payload, std::uint64_t seq);
  void OnDisconnect(std::string_view reason);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string connection_id_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RoomService> room_service_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  std::atomic<bool> closing_{false};
  bool disconnected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace focusroom
