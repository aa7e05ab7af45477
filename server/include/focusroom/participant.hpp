/*
 * 설명: 참가자별 집중/산만 상태와 누적 시간, 점수, 혼란 카운터를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_focus_test.cpp, server/tests/unit/room_membership_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace focusroom {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class FocusState { kFocused, kDistracted };

struct Participant {
  std::string connection_id;
  std::string display_name;
  std::optional<std::string> avatar_ref;
  FocusState focus_state{FocusState::kFocused};
  // 둘 중 정확히 하나만 값을 가진다.
  std::optional<TimePoint> focused_since;
  std::optional<TimePoint> distracted_since;
  // 닫힌 구간만 합산한다. 밀리초 변환은 출력 시점에만 한다.
  Clock::duration accumulated_focused{Clock::duration::zero()};
  Clock::duration accumulated_distracted{Clock::duration::zero()};
  TimePoint joined_at{};
  double score{0.0};
  bool confused{false};
  std::uint64_t confusion_event_count{0};

  bool IsDistracted() const { return focus_state == FocusState::kDistracted; }
  Clock::duration FocusedTotal(TimePoint now) const;
  Clock::duration DistractedTotal(TimePoint now) const;
  void CloseOpenInterval(TimePoint now);
};

struct DepartureMetrics {
  std::string connection_id;
  std::string display_name;
  std::int64_t focused_ms{0};
  std::int64_t distracted_ms{0};
  double focus_percentage{0.0};
  double score{0.0};
  std::uint64_t confusion_event_count{0};
  std::int64_t session_duration_ms{0};
};

DepartureMetrics FinalizeDeparture(Participant& participant, TimePoint now);
nlohmann::json ToJson(const DepartureMetrics& metrics);

std::int64_t ToMillis(Clock::duration duration);
std::int64_t ToEpochMillis(TimePoint tp);

}  // namespace focusroom
