/*
 * 설명: WebSocket 메시지를 읽어 룸 서비스로 분기하고, 서버 이벤트를 제한된 큐로 전송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "focusroom/websocket_session.hpp"

#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "focusroom/events.hpp"
#include "focusroom/participant.hpp"

namespace focusroom {
namespace {
std::optional<std::string> StringField(const nlohmann::json& payload, const char* primary,
                                       const char* alias = nullptr) {
  for (const char* key : {primary, alias}) {
    if (key == nullptr) {
      continue;
    }
    auto it = payload.find(key);
    if (it != payload.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return std::nullopt;
}
}  // namespace

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::string connection_id, std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<RoomService> room_service,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), connection_id_(std::move(connection_id)), coordinator_(std::move(coordinator)),
      room_service_(std::move(room_service)), observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { coordinator_->Unregister(connection_id_, this); }

void WebSocketSession::Run() {
  coordinator_->Register(connection_id_, shared_from_this());
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "connection.open", connection_id_, std::nullopt);
  }
  WsEnvelope env{.type = "event",
                 .event = events::kConnectionReady,
                 .seq = 0,
                 .payload = {{"connectionId", connection_id_}, {"serverTimestamp", ToEpochMillis(Clock::now())}}};
  EnqueueMessage(ToWsJson(env).dump());
  DoRead();
}

bool WebSocketSession::Deliver(const std::string& event, const nlohmann::json& payload) {
  if (closing_) {
    return false;
  }
  WsEnvelope env{.type = "event", .event = event, .seq = 0, .payload = payload};
  auto message = ToWsJson(env).dump();
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(),
                    [self, message = std::move(message)]() mutable { self->EnqueueMessage(std::move(message)); });
  return true;
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    return OnDisconnect("closed");
  }
  if (ec) {
    return OnDisconnect(ec.message());
  }
  if (closing_) {
    return OnDisconnect("closing");
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  std::optional<WsEnvelope> env;
  try {
    env = ParseWsEnvelope(nlohmann::json::parse(data));
  } catch (const std::exception&) {
    SendError("bad_request", "JSON 파싱 오류", 0);
    return DoRead();
  }
  if (!env) {
    SendError("bad_request", "잘못된 메시지 형식", 0);
    return DoRead();
  }
  if (env->type != "event") {
    SendError("bad_request", "알 수 없는 메시지 유형", env->seq);
    return DoRead();
  }
  Dispatch(*env);
  DoRead();
}

void WebSocketSession::Dispatch(const WsEnvelope& env) {
  const auto& event = env.event;
  if (event == events::kRoomJoin) {
    HandleJoin(env.payload, env.seq);
  } else if (event == events::kRoomLeave) {
    HandleLeave(env.payload, env.seq);
  } else if (event == events::kTimerStart) {
    auto phase = StringField(env.payload, "phase");
    room_service_->HandleTimerStart(connection_id_, phase.value_or("focus"));
  } else if (event == events::kTimerStop) {
    room_service_->HandleTimerStop(connection_id_);
  } else if (event == events::kUserDistracted) {
    room_service_->HandleDistracted(connection_id_);
  } else if (event == events::kUserFocused) {
    room_service_->HandleFocused(connection_id_);
  } else if (event == events::kExpressionFrame) {
    room_service_->HandleExpressionFrame(connection_id_, env.payload);
  } else if (observability_) {
    observability_->LogEvent(LogLevel::kDebug, "ws.event.unknown", connection_id_, std::nullopt,
                             {{"event", event}});
  }
}

void WebSocketSession::HandleJoin(const nlohmann::json& payload, std::uint64_t /*seq*/) {
  auto room_code = StringField(payload, "roomCode");
  auto display_name = StringField(payload, "displayName", "username");
  // 필수 필드가 없으면 조용히 무시한다.
  if (!room_code || !display_name) {
    return;
  }
  room_service_->HandleJoin(connection_id_,
                            JoinRequest{*room_code, *display_name, StringField(payload, "avatarRef", "avatarUrl")});
}

void WebSocketSession::HandleLeave(const nlohmann::json& payload, std::uint64_t /*seq*/) {
  auto room_code = StringField(payload, "roomCode");
  if (!room_code) {
    return;
  }
  room_service_->HandleLeave(connection_id_, *room_code);
}

void WebSocketSession::OnDisconnect(std::string_view reason) {
  if (disconnected_) {
    return;
  }
  disconnected_ = true;
  closing_ = true;
  coordinator_->Unregister(connection_id_, this);
  room_service_->HandleDisconnect(connection_id_);
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "connection.close", connection_id_, std::nullopt,
                             {{"reason", reason}});
  }
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  if (observability_) {
    observability_->LogEvent(LogLevel::kWarn, "connection.backpressure", connection_id_, std::nullopt,
                             {{"maxMessages", max_queue_messages_}, {"maxBytes", max_queue_bytes_}});
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace focusroom
