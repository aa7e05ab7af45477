/*
 * 설명: 수신 이벤트를 세션 테이블로 룸에 연결하고, 룸 스트랜드 위에서 상태 변경과 전파를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_service_it_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "focusroom/confusion_detector.hpp"
#include "focusroom/observability.hpp"
#include "focusroom/realtime.hpp"
#include "focusroom/room_registry.hpp"
#include "focusroom/session_table.hpp"

namespace focusroom {

struct RoomSettings {
  std::chrono::seconds focus_duration{std::chrono::minutes(25)};
  std::chrono::seconds break_duration{std::chrono::minutes(5)};
};

struct JoinRequest {
  std::string room_code;
  std::string display_name;
  std::optional<std::string> avatar_ref;
};

class RoomService : public std::enable_shared_from_this<RoomService> {
 public:
  RoomService(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<SessionTable> sessions,
              std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability,
              const RoomSettings& settings);

  void HandleJoin(const std::string& connection_id, const JoinRequest& request);
  void HandleLeave(const std::string& connection_id, const std::string& room_code);
  void HandleDisconnect(const std::string& connection_id);
  void HandleTimerStart(const std::string& connection_id, const std::string& phase);
  void HandleTimerStop(const std::string& connection_id);
  void HandleDistracted(const std::string& connection_id);
  void HandleFocused(const std::string& connection_id);
  void HandleExpressionFrame(const std::string& connection_id, const nlohmann::json& frame);

  // 룸 스트랜드 위에서 호출해야 한다.
  void PublishRoomMetrics(const std::shared_ptr<RoomContext>& ctx);
  void CloseAllRooms();

  std::shared_ptr<RoomRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<SessionTable> GetSessions() { return sessions_; }
  const RoomSettings& GetSettings() const { return settings_; }

 private:
  std::shared_ptr<RoomContext> ResolveRoom(const std::string& connection_id) const;
  void JoinRoom(const std::string& connection_id, const JoinRequest& request);
  void LeaveRoom(const std::string& connection_id, const std::string& room_code, bool deliver_metrics);
  void HandleFocusChange(const std::string& connection_id, bool distracted);
  void CompleteTimer(const std::shared_ptr<RoomContext>& ctx, std::uint64_t generation);
  void CloseIfEmpty(const std::shared_ptr<RoomContext>& ctx);
  void SendToConnection(const std::string& connection_id, const std::string& event, const nlohmann::json& payload);
  void Broadcast(const std::shared_ptr<RoomContext>& ctx, const std::string& event, const nlohmann::json& payload,
                 const std::optional<std::string>& exclude = std::nullopt);
  void BroadcastGroupMetrics(const std::shared_ptr<RoomContext>& ctx);

  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<SessionTable> sessions_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  RoomSettings settings_;
  ConfusionDetector detector_;
};

}  // namespace focusroom
