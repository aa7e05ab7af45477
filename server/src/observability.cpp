/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "focusroom/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace focusroom {

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() const {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::AddBroadcastFailures(std::uint64_t count) { broadcast_failures_.fetch_add(count); }

void Observability::IncrementMetricsTick() { metrics_ticks_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_rooms, std::uint64_t active_sessions) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_rooms = active_rooms;
  snapshot.active_sessions = active_sessions;
  snapshot.broadcast_failures = broadcast_failures_.load();
  snapshot.metrics_ticks = metrics_ticks_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (ctx.room_code) {
    log_json["roomCode"] = *ctx.room_code;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

void Observability::LogEvent(LogLevel level, const std::string& name, const std::optional<std::string>& connection_id,
                             const std::optional<std::string>& room_code, const nlohmann::json& detail) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = NextTraceId();
  ctx.connection_id = connection_id;
  ctx.room_code = room_code;
  ctx.name = name;
  ctx.level = level;
  ctx.detail = detail;
  Log(ctx);
}

}  // namespace focusroom
