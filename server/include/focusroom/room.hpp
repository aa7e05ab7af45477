/*
 * 설명: 룸 단위 참가자 집합, 호스트 지정, 그룹 점수와 공유 타이머 상태를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_membership_test.cpp, server/tests/unit/room_focus_test.cpp,
 *         server/tests/unit/room_scoring_test.cpp, server/tests/unit/room_timer_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "focusroom/participant.hpp"

namespace focusroom {

enum class TimerPhase { kFocus, kBreak };

const char* TimerPhaseToString(TimerPhase phase);
std::optional<TimerPhase> ParseTimerPhase(std::string_view value);

struct ScoringConfig {
  double base_rate_per_second{10.0};
  double penalty_per_distracted{0.1};
};

struct TimerStart {
  TimePoint end_at;
  TimerPhase phase;
  std::chrono::seconds duration;
  std::uint64_t generation;

  double DurationMinutes() const { return static_cast<double>(duration.count()) / 60.0; }
};

class Room {
 public:
  // 산만 인원이 많아도 기본 속도의 5%는 유지된다.
  static constexpr double kMaxPenalty = 0.95;

  Room(std::string code, const ScoringConfig& scoring);

  const std::string& Code() const { return code_; }

  bool AddParticipant(const std::string& connection_id, const std::string& display_name,
                      const std::optional<std::string>& avatar_ref, TimePoint now);
  std::optional<DepartureMetrics> RemoveParticipant(const std::string& connection_id, TimePoint now);

  bool MarkDistracted(const std::string& connection_id, TimePoint now);
  bool MarkFocused(const std::string& connection_id, TimePoint now);
  std::optional<std::uint64_t> RecordConfusion(const std::string& connection_id);

  std::size_t CurrentDistractedCount() const;
  std::size_t CurrentFocusedCount() const;
  double GroupDps() const;
  double TickAndDistribute(double seconds);

  TimerStart StartTimer(TimerPhase phase, std::chrono::seconds duration, TimePoint now);
  void StopTimer();
  bool CompleteTimer(std::uint64_t generation);
  bool TimerRunning() const { return timer_end_.has_value(); }
  std::optional<TimePoint> TimerEnd() const { return timer_end_; }
  TimerPhase Phase() const { return timer_phase_; }
  std::uint64_t TimerGeneration() const { return timer_generation_; }

  const std::optional<std::string>& HostId() const { return host_id_; }
  bool IsHost(const std::string& connection_id) const;
  const Participant* FindParticipant(const std::string& connection_id) const;
  std::size_t ParticipantCount() const { return participants_.size(); }
  bool Empty() const { return participants_.empty(); }
  double GroupScore() const { return group_score_; }

  nlohmann::json Snapshot(TimePoint now) const;

 private:
  bool Transition(const std::string& connection_id, FocusState target, TimePoint now);
  void ReassignHost();
  std::vector<const Participant*> OrderedParticipants() const;

  std::string code_;
  ScoringConfig scoring_;
  std::unordered_map<std::string, Participant> participants_;
  std::optional<std::string> host_id_;
  // timer_end_과 timer_phase_는 항상 함께 갱신한다.
  std::optional<TimePoint> timer_end_;
  TimerPhase timer_phase_{TimerPhase::kFocus};
  std::uint64_t timer_generation_{0};
  double group_score_{0.0};
};

}  // namespace focusroom
