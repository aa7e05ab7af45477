/*
 * 설명: 클라이언트와 주고받는 WS 이벤트 이름을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

namespace focusroom::events {

// 클라이언트 -> 서버
inline constexpr const char* kRoomJoin = "room:join";
inline constexpr const char* kRoomLeave = "room:leave";
inline constexpr const char* kTimerStart = "timer:start";
inline constexpr const char* kTimerStop = "timer:stop";
inline constexpr const char* kUserDistracted = "user:distracted";
inline constexpr const char* kUserFocused = "user:focused";
inline constexpr const char* kExpressionFrame = "avatar:blend-shapes";

// 서버 -> 클라이언트
inline constexpr const char* kConnectionReady = "connection:ready";
inline constexpr const char* kRoomState = "room:state";
inline constexpr const char* kUserJoined = "user:joined";
inline constexpr const char* kUserLeft = "user:left";
inline constexpr const char* kUserStatusChanged = "user:status-changed";
inline constexpr const char* kUserConfused = "user:confused";
inline constexpr const char* kUserMetrics = "user:metrics";
inline constexpr const char* kTimerStarted = "timer:started";
inline constexpr const char* kTimerStopped = "timer:stopped";
inline constexpr const char* kTimerEnded = "timer:ended";
inline constexpr const char* kGroupScoreUpdated = "group:score-updated";
inline constexpr const char* kGroupDpsUpdated = "group:dps-updated";
inline constexpr const char* kExpressionFrameRelay = "avatar:blend-shapes-update";

}  // namespace focusroom::events
