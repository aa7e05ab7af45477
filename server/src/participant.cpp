/*
 * 설명: 참가자 구간 누적과 퇴장 시 최종 지표 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_focus_test.cpp, server/tests/unit/room_membership_test.cpp
 */
#include "focusroom/participant.hpp"

#include <algorithm>
#include <cmath>

namespace focusroom {
namespace {
Clock::duration Elapsed(const std::optional<TimePoint>& since, TimePoint now) {
  if (!since || now <= *since) {
    return Clock::duration::zero();
  }
  return now - *since;
}
}  // namespace

Clock::duration Participant::FocusedTotal(TimePoint now) const {
  return accumulated_focused + Elapsed(focused_since, now);
}

Clock::duration Participant::DistractedTotal(TimePoint now) const {
  return accumulated_distracted + Elapsed(distracted_since, now);
}

void Participant::CloseOpenInterval(TimePoint now) {
  if (focused_since) {
    accumulated_focused += Elapsed(focused_since, now);
    focused_since = std::max(*focused_since, now);
  }
  if (distracted_since) {
    accumulated_distracted += Elapsed(distracted_since, now);
    distracted_since = std::max(*distracted_since, now);
  }
}

DepartureMetrics FinalizeDeparture(Participant& participant, TimePoint now) {
  participant.CloseOpenInterval(now);

  DepartureMetrics metrics;
  metrics.connection_id = participant.connection_id;
  metrics.display_name = participant.display_name;
  metrics.focused_ms = ToMillis(participant.accumulated_focused);
  metrics.distracted_ms = ToMillis(participant.accumulated_distracted);
  const auto total_ms = metrics.focused_ms + metrics.distracted_ms;
  metrics.focus_percentage =
      total_ms > 0 ? static_cast<double>(metrics.focused_ms) / static_cast<double>(total_ms) * 100.0 : 0.0;
  metrics.score = std::round(participant.score * 100.0) / 100.0;
  metrics.confusion_event_count = participant.confusion_event_count;
  metrics.session_duration_ms = now > participant.joined_at ? ToMillis(now - participant.joined_at) : 0;
  return metrics;
}

nlohmann::json ToJson(const DepartureMetrics& metrics) {
  return {{"displayName", metrics.display_name},
          {"focusedMs", metrics.focused_ms},
          {"distractedMs", metrics.distracted_ms},
          {"focusPercentage", metrics.focus_percentage},
          {"score", metrics.score},
          {"confusionEventCount", metrics.confusion_event_count},
          {"sessionDurationMs", metrics.session_duration_ms}};
}

std::int64_t ToMillis(Clock::duration duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::int64_t ToEpochMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace focusroom
