/*
 * 설명: REST/WS 응답 엔벨로프 생성과 WS 수신 엔벨로프 해석을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace focusroom {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);

// 형식이 맞지 않으면 nullopt. payload가 없으면 빈 객체로 채운다.
std::optional<WsEnvelope> ParseWsEnvelope(const nlohmann::json& message);

}  // namespace focusroom
