/*
 * 설명: 연결별 전송 대상을 관리하고 룸 채널 단위 멀티캐스트를 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/realtime_test.cpp, server/tests/it/room_service_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "focusroom/observability.hpp"

namespace focusroom {

// 전송 계층이 구현한다. 전달을 포기하면 false를 반환한다.
class ConnectionSink {
 public:
  virtual ~ConnectionSink() = default;
  virtual bool Deliver(const std::string& event, const nlohmann::json& payload) = 0;
};

struct DeliveryReport {
  std::size_t targeted{0};
  std::size_t delivered{0};
  std::vector<std::string> failed;

  bool Ok() const { return failed.empty(); }
};

std::string GenerateConnectionId();

class RealtimeCoordinator {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  void Register(const std::string& connection_id, const std::shared_ptr<ConnectionSink>& sink);
  void Unregister(const std::string& connection_id, const ConnectionSink* sink);
  bool IsConnected(const std::string& connection_id) const;

  void JoinChannel(const std::string& connection_id, const std::string& room_code);
  void LeaveChannel(const std::string& connection_id, const std::string& room_code);

  DeliveryReport SendEventToConnection(const std::string& connection_id, const std::string& event,
                                       const nlohmann::json& payload);
  DeliveryReport BroadcastToRoom(const std::string& room_code, const std::string& event, const nlohmann::json& payload,
                                 const std::optional<std::string>& exclude = std::nullopt);

  std::size_t ActiveConnections() const;
  std::size_t ChannelSize(const std::string& room_code) const;

 private:
  struct Entry {
    std::weak_ptr<ConnectionSink> sink;
    const ConnectionSink* raw{nullptr};
    std::unordered_set<std::string> channels;
  };

  using Target = std::pair<std::string, std::shared_ptr<ConnectionSink>>;

  // 이미 끊긴 연결은 sink가 비어 있으며 실패로 집계된다.
  DeliveryReport DeliverAll(const std::vector<Target>& targets, const std::string& event,
                            const nlohmann::json& payload) const;
  void ReportFailures(const DeliveryReport& report, const std::string& event,
                      const std::optional<std::string>& room_code) const;

  std::unordered_map<std::string, Entry> connections_;
  std::unordered_map<std::string, std::unordered_set<std::string>> channels_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace focusroom
