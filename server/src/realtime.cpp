/*
 * 설명: 연결별 전송 대상과 룸 채널을 관리하고 서버 이벤트를 안전하게 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/realtime_test.cpp, server/tests/it/room_service_it_test.cpp
 */
#include "focusroom/realtime.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

namespace focusroom {
namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string GenerateConnectionId() {
  std::vector<unsigned char> buffer(16);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("연결 ID 난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

void RealtimeCoordinator::Register(const std::string& connection_id, const std::shared_ptr<ConnectionSink>& sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = connections_[connection_id];
  entry.sink = sink;
  entry.raw = sink.get();
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

void RealtimeCoordinator::Unregister(const std::string& connection_id, const ConnectionSink* sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return;
  }
  if (it->second.raw != sink) {
    return;
  }
  for (const auto& room_code : it->second.channels) {
    auto channel_it = channels_.find(room_code);
    if (channel_it == channels_.end()) {
      continue;
    }
    channel_it->second.erase(connection_id);
    if (channel_it->second.empty()) {
      channels_.erase(channel_it);
    }
  }
  connections_.erase(it);
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

bool RealtimeCoordinator::IsConnected(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  return it != connections_.end() && !it->second.sink.expired();
}

void RealtimeCoordinator::JoinChannel(const std::string& connection_id, const std::string& room_code) {
  std::lock_guard<std::mutex> lock(mutex_);
  channels_[room_code].insert(connection_id);
  auto it = connections_.find(connection_id);
  if (it != connections_.end()) {
    it->second.channels.insert(room_code);
  }
}

void RealtimeCoordinator::LeaveChannel(const std::string& connection_id, const std::string& room_code) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto channel_it = channels_.find(room_code);
  if (channel_it != channels_.end()) {
    channel_it->second.erase(connection_id);
    if (channel_it->second.empty()) {
      channels_.erase(channel_it);
    }
  }
  auto it = connections_.find(connection_id);
  if (it != connections_.end()) {
    it->second.channels.erase(room_code);
  }
}

DeliveryReport RealtimeCoordinator::SendEventToConnection(const std::string& connection_id, const std::string& event,
                                                          const nlohmann::json& payload) {
  std::vector<Target> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    targets.emplace_back(connection_id, it == connections_.end() ? nullptr : it->second.sink.lock());
  }
  auto report = DeliverAll(targets, event, payload);
  ReportFailures(report, event, std::nullopt);
  return report;
}

DeliveryReport RealtimeCoordinator::BroadcastToRoom(const std::string& room_code, const std::string& event,
                                                    const nlohmann::json& payload,
                                                    const std::optional<std::string>& exclude) {
  std::vector<Target> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto channel_it = channels_.find(room_code);
    if (channel_it != channels_.end()) {
      targets.reserve(channel_it->second.size());
      for (const auto& connection_id : channel_it->second) {
        if (exclude && *exclude == connection_id) {
          continue;
        }
        auto it = connections_.find(connection_id);
        targets.emplace_back(connection_id, it == connections_.end() ? nullptr : it->second.sink.lock());
      }
    }
  }
  auto report = DeliverAll(targets, event, payload);
  ReportFailures(report, event, room_code);
  return report;
}

DeliveryReport RealtimeCoordinator::DeliverAll(const std::vector<Target>& targets, const std::string& event,
                                               const nlohmann::json& payload) const {
  DeliveryReport report;
  report.targeted = targets.size();
  for (const auto& [connection_id, sink] : targets) {
    if (!sink) {
      report.failed.push_back(connection_id);
      continue;
    }
    bool delivered = false;
    try {
      delivered = sink->Deliver(event, payload);
    } catch (const std::exception& ex) {
      if (observability_) {
        observability_->LogEvent(LogLevel::kWarn, "delivery.exception", connection_id, std::nullopt,
                                 {{"event", event}, {"error", ex.what()}});
      }
    }
    if (delivered) {
      ++report.delivered;
    } else {
      report.failed.push_back(connection_id);
    }
  }
  return report;
}

void RealtimeCoordinator::ReportFailures(const DeliveryReport& report, const std::string& event,
                                         const std::optional<std::string>& room_code) const {
  if (report.Ok() || !observability_) {
    return;
  }
  observability_->AddBroadcastFailures(report.failed.size());
  observability_->LogEvent(LogLevel::kWarn, "delivery.failed", std::nullopt, room_code,
                           {{"event", event},
                            {"targeted", report.targeted},
                            {"delivered", report.delivered},
                            {"failed", report.failed}});
}

std::size_t RealtimeCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t RealtimeCoordinator::ChannelSize(const std::string& room_code) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(room_code);
  return it == channels_.end() ? 0 : it->second.size();
}

}  // namespace focusroom
