/*
 * 설명: 룸 참가/퇴장, 집중 상태 전환, 그룹 점수 분배와 타이머 세대 관리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_membership_test.cpp, server/tests/unit/room_focus_test.cpp,
 *         server/tests/unit/room_scoring_test.cpp, server/tests/unit/room_timer_test.cpp
 */
#include "focusroom/room.hpp"

#include <algorithm>

namespace focusroom {

const char* TimerPhaseToString(TimerPhase phase) {
  switch (phase) {
    case TimerPhase::kFocus:
      return "focus";
    case TimerPhase::kBreak:
      return "break";
  }
  return "focus";
}

std::optional<TimerPhase> ParseTimerPhase(std::string_view value) {
  if (value == "focus") {
    return TimerPhase::kFocus;
  }
  if (value == "break") {
    return TimerPhase::kBreak;
  }
  return std::nullopt;
}

Room::Room(std::string code, const ScoringConfig& scoring) : code_(std::move(code)), scoring_(scoring) {}

bool Room::AddParticipant(const std::string& connection_id, const std::string& display_name,
                          const std::optional<std::string>& avatar_ref, TimePoint now) {
  if (display_name.empty() || connection_id.empty()) {
    return false;
  }
  if (participants_.count(connection_id) > 0) {
    return false;
  }
  Participant participant;
  participant.connection_id = connection_id;
  participant.display_name = display_name;
  participant.avatar_ref = avatar_ref;
  participant.focus_state = FocusState::kFocused;
  participant.focused_since = now;
  participant.joined_at = now;
  participants_.emplace(connection_id, std::move(participant));

  if (!host_id_) {
    host_id_ = connection_id;
  }
  return true;
}

std::optional<DepartureMetrics> Room::RemoveParticipant(const std::string& connection_id, TimePoint now) {
  auto it = participants_.find(connection_id);
  if (it == participants_.end()) {
    return std::nullopt;
  }
  auto metrics = FinalizeDeparture(it->second, now);
  participants_.erase(it);

  if (host_id_ && *host_id_ == connection_id) {
    ReassignHost();
  }
  return metrics;
}

bool Room::MarkDistracted(const std::string& connection_id, TimePoint now) {
  return Transition(connection_id, FocusState::kDistracted, now);
}

bool Room::MarkFocused(const std::string& connection_id, TimePoint now) {
  return Transition(connection_id, FocusState::kFocused, now);
}

bool Room::Transition(const std::string& connection_id, FocusState target, TimePoint now) {
  auto it = participants_.find(connection_id);
  if (it == participants_.end()) {
    return false;
  }
  auto& participant = it->second;
  if (participant.focus_state == target) {
    return false;
  }
  participant.CloseOpenInterval(now);
  if (target == FocusState::kDistracted) {
    participant.distracted_since = participant.focused_since.value_or(now);
    participant.focused_since.reset();
  } else {
    participant.focused_since = participant.distracted_since.value_or(now);
    participant.distracted_since.reset();
  }
  participant.focus_state = target;
  return true;
}

std::optional<std::uint64_t> Room::RecordConfusion(const std::string& connection_id) {
  auto it = participants_.find(connection_id);
  if (it == participants_.end()) {
    return std::nullopt;
  }
  it->second.confused = true;
  return ++it->second.confusion_event_count;
}

std::size_t Room::CurrentDistractedCount() const {
  return static_cast<std::size_t>(std::count_if(participants_.begin(), participants_.end(),
                                                [](const auto& entry) { return entry.second.IsDistracted(); }));
}

std::size_t Room::CurrentFocusedCount() const { return participants_.size() - CurrentDistractedCount(); }

double Room::GroupDps() const {
  const double penalty = std::min(scoring_.penalty_per_distracted * static_cast<double>(CurrentDistractedCount()),
                                  kMaxPenalty);
  return scoring_.base_rate_per_second * std::max(0.0, 1.0 - penalty);
}

double Room::TickAndDistribute(double seconds) {
  const auto focused = CurrentFocusedCount();
  if (focused == 0 || seconds <= 0.0) {
    return 0.0;
  }
  const double points = GroupDps() * seconds;
  const double share = points / static_cast<double>(focused);
  for (auto& entry : participants_) {
    if (!entry.second.IsDistracted()) {
      entry.second.score += share;
    }
  }
  group_score_ += points;
  return points;
}

TimerStart Room::StartTimer(TimerPhase phase, std::chrono::seconds duration, TimePoint now) {
  timer_end_ = now + duration;
  timer_phase_ = phase;
  ++timer_generation_;
  return TimerStart{*timer_end_, timer_phase_, duration, timer_generation_};
}

void Room::StopTimer() {
  timer_end_.reset();
  ++timer_generation_;
}

bool Room::CompleteTimer(std::uint64_t generation) {
  if (!timer_end_ || generation != timer_generation_) {
    return false;
  }
  timer_end_.reset();
  return true;
}

bool Room::IsHost(const std::string& connection_id) const { return host_id_ && *host_id_ == connection_id; }

const Participant* Room::FindParticipant(const std::string& connection_id) const {
  auto it = participants_.find(connection_id);
  return it == participants_.end() ? nullptr : &it->second;
}

void Room::ReassignHost() {
  auto ordered = OrderedParticipants();
  if (ordered.empty()) {
    host_id_.reset();
    return;
  }
  host_id_ = ordered.front()->connection_id;
}

std::vector<const Participant*> Room::OrderedParticipants() const {
  std::vector<const Participant*> ordered;
  ordered.reserve(participants_.size());
  for (const auto& entry : participants_) {
    ordered.push_back(&entry.second);
  }
  std::sort(ordered.begin(), ordered.end(), [](const Participant* lhs, const Participant* rhs) {
    if (lhs->joined_at == rhs->joined_at) {
      return lhs->connection_id < rhs->connection_id;
    }
    return lhs->joined_at < rhs->joined_at;
  });
  return ordered;
}

nlohmann::json Room::Snapshot(TimePoint now) const {
  nlohmann::json participants_json = nlohmann::json::array();
  std::optional<std::string> host_name;
  for (const auto* participant : OrderedParticipants()) {
    const bool is_host = IsHost(participant->connection_id);
    if (is_host) {
      host_name = participant->display_name;
    }
    participants_json.push_back(
        {{"displayName", participant->display_name},
         {"avatarRef", participant->avatar_ref ? nlohmann::json(*participant->avatar_ref) : nlohmann::json(nullptr)},
         {"isDistracted", participant->IsDistracted()},
         {"isHost", is_host},
         {"score", participant->score},
         {"confused", participant->confused},
         {"confusionEventCount", participant->confusion_event_count},
         {"focusedMs", ToMillis(participant->FocusedTotal(now))},
         {"distractedMs", ToMillis(participant->DistractedTotal(now))}});
  }

  return nlohmann::json{
      {"roomCode", code_},
      {"participants", participants_json},
      {"hostDisplayName", host_name ? nlohmann::json(*host_name) : nlohmann::json(nullptr)},
      {"timerRunning", timer_end_.has_value() && *timer_end_ > now},
      {"endTimestamp", timer_end_ ? nlohmann::json(ToEpochMillis(*timer_end_)) : nlohmann::json(nullptr)},
      {"phase", TimerPhaseToString(timer_phase_)},
      {"groupScore", group_score_},
      {"groupDps", GroupDps()},
      {"distractedCount", CurrentDistractedCount()},
      {"serverTimestamp", ToEpochMillis(now)}};
}

}  // namespace focusroom
