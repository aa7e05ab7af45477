/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace focusroom {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);
const char* LogLevelToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> connection_id;
  std::optional<std::string> room_code;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_rooms{0};
  std::uint64_t active_sessions{0};
  std::uint64_t broadcast_failures{0};
  std::uint64_t metrics_ticks{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId() const;
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void AddBroadcastFailures(std::uint64_t count);
  void IncrementMetricsTick();
  MetricsSnapshot Snapshot(std::uint64_t active_rooms, std::uint64_t active_sessions) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& connection_id,
                const std::optional<std::string>& room_code, const nlohmann::json& detail = nullptr) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> broadcast_failures_{0};
  std::atomic<std::uint64_t> metrics_ticks_{0};
  mutable std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace focusroom
