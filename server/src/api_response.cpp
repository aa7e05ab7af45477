/*
 * 설명: JSON 응답 엔벨로프를 생성하고 WS 메시지를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "focusroom/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace focusroom {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload.is_null() ? nlohmann::json::object() : env.payload;
  return j;
}

std::optional<WsEnvelope> ParseWsEnvelope(const nlohmann::json& message) {
  if (!message.is_object()) {
    return std::nullopt;
  }
  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string()) {
    return std::nullopt;
  }
  WsEnvelope env{.type = type_it->get<std::string>(), .event = "", .seq = 0, .payload = nlohmann::json::object()};
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    env.seq = seq_it->get<std::uint64_t>();
  }
  if (env.type != "event") {
    return env;
  }
  auto event_it = message.find("event");
  if (event_it == message.end() || !event_it->is_string()) {
    return std::nullopt;
  }
  env.event = event_it->get<std::string>();
  auto payload_it = message.find("p");
  if (payload_it != message.end() && !payload_it->is_null()) {
    env.payload = *payload_it;
  }
  return env;
}

}  // namespace focusroom
