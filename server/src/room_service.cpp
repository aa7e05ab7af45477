/*
 * 설명: 룸 참가/퇴장, 타이머 제어, 집중 상태와 표정 프레임 이벤트를 룸 스트랜드에서 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_service_it_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "focusroom/room_service.hpp"

#include <boost/asio/dispatch.hpp>

#include "focusroom/events.hpp"

namespace focusroom {

RoomService::RoomService(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<SessionTable> sessions,
                         std::shared_ptr<RealtimeCoordinator> coordinator,
                         std::shared_ptr<Observability> observability, const RoomSettings& settings)
    : registry_(std::move(registry)), sessions_(std::move(sessions)), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)), settings_(settings) {}

void RoomService::HandleJoin(const std::string& connection_id, const JoinRequest& request) {
  if (request.room_code.empty() || request.display_name.empty()) {
    return;
  }
  // 세션 테이블이 연결의 최종 소속을 정한다. 스트랜드 작업보다 먼저 기록해야
  // 뒤따르는 참가/퇴장/끊김이 아직 처리 중인 참가를 볼 수 있다.
  auto previous = sessions_->Exchange(connection_id, SessionEntry{request.room_code, request.display_name});
  if (previous) {
    if (previous->room_code == request.room_code) {
      sessions_->Put(connection_id, *previous);
    } else {
      LeaveRoom(connection_id, previous->room_code, true);
    }
  }
  JoinRoom(connection_id, request);
}

void RoomService::JoinRoom(const std::string& connection_id, const JoinRequest& request) {
  auto ctx = registry_->GetOrCreate(request.room_code);
  auto self = shared_from_this();
  boost::asio::dispatch(ctx->strand, [self, ctx, connection_id, request]() {
    if (ctx->closed) {
      // 마지막 퇴장과 경합한 경우 새 룸으로 다시 시도한다.
      self->JoinRoom(connection_id, request);
      return;
    }
    auto now = Clock::now();
    auto& room = ctx->room;
    const bool created = room.Empty();
    if (!room.AddParticipant(connection_id, request.display_name, request.avatar_ref, now)) {
      if (room.FindParticipant(connection_id)) {
        self->SendToConnection(connection_id, events::kRoomState, room.Snapshot(now));
      }
      self->CloseIfEmpty(ctx);
      return;
    }

    // 이후의 참가/퇴장/끊김으로 대체된 참가는 되돌린다.
    auto session = self->sessions_->Find(connection_id);
    const bool current = session && session->room_code == room.Code();
    if (!current || !self->coordinator_->IsConnected(connection_id)) {
      room.RemoveParticipant(connection_id, now);
      if (current) {
        self->sessions_->RemoveIf(connection_id, room.Code());
      }
      if (self->observability_) {
        self->observability_->LogEvent(LogLevel::kDebug, "room.join.superseded", connection_id, room.Code());
      }
      self->CloseIfEmpty(ctx);
      return;
    }
    self->coordinator_->JoinChannel(connection_id, room.Code());

    if (created && self->observability_) {
      self->observability_->LogEvent(LogLevel::kInfo, "room.created", std::nullopt, room.Code());
    }
    if (self->observability_) {
      self->observability_->LogEvent(LogLevel::kInfo, "room.join", connection_id, room.Code(),
                                     {{"displayName", request.display_name},
                                      {"participants", room.ParticipantCount()},
                                      {"isHost", room.IsHost(connection_id)}});
    }

    self->SendToConnection(connection_id, events::kRoomState, room.Snapshot(now));
    self->Broadcast(ctx, events::kUserJoined,
                    {{"displayName", request.display_name},
                     {"avatarRef", request.avatar_ref ? nlohmann::json(*request.avatar_ref) : nlohmann::json(nullptr)}},
                    connection_id);
  });
}

void RoomService::HandleLeave(const std::string& connection_id, const std::string& room_code) {
  if (!sessions_->RemoveIf(connection_id, room_code)) {
    return;
  }
  LeaveRoom(connection_id, room_code, true);
}

void RoomService::HandleDisconnect(const std::string& connection_id) {
  auto session = sessions_->Remove(connection_id);
  if (!session) {
    return;
  }
  LeaveRoom(connection_id, session->room_code, false);
}

// 세션 항목은 호출자가 이미 정리했다. 여기서는 룸 상태만 바꾼다.
void RoomService::LeaveRoom(const std::string& connection_id, const std::string& room_code, bool deliver_metrics) {
  auto ctx = registry_->Get(room_code);
  if (!ctx) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::dispatch(ctx->strand, [self, ctx, connection_id, deliver_metrics]() {
    auto& room = ctx->room;
    auto metrics = room.RemoveParticipant(connection_id, Clock::now());
    if (!metrics) {
      return;
    }
    self->coordinator_->LeaveChannel(connection_id, room.Code());

    if (self->observability_) {
      self->observability_->LogEvent(LogLevel::kInfo, "room.leave", connection_id, room.Code(), ToJson(*metrics));
    }
    if (deliver_metrics) {
      self->SendToConnection(connection_id, events::kUserMetrics, ToJson(*metrics));
    }
    self->Broadcast(ctx, events::kUserLeft, {{"displayName", metrics->display_name}});

    if (room.Empty()) {
      self->CloseIfEmpty(ctx);
      return;
    }
    // 호스트가 바뀌었을 수 있으므로 남은 참가자에게 상태를 다시 보낸다.
    self->Broadcast(ctx, events::kRoomState, room.Snapshot(Clock::now()));
  });
}

void RoomService::CloseIfEmpty(const std::shared_ptr<RoomContext>& ctx) {
  if (ctx->closed || !ctx->room.Empty()) {
    return;
  }
  ctx->closed = true;
  ctx->timer.Cancel();
  if (registry_->DeleteIfSame(ctx->room.Code(), ctx.get()) && observability_) {
    observability_->LogEvent(LogLevel::kInfo, "room.deleted", std::nullopt, ctx->room.Code());
  }
}

std::shared_ptr<RoomContext> RoomService::ResolveRoom(const std::string& connection_id) const {
  auto session = sessions_->Find(connection_id);
  if (!session) {
    return nullptr;
  }
  return registry_->Get(session->room_code);
}

void RoomService::HandleTimerStart(const std::string& connection_id, const std::string& phase) {
  auto ctx = ResolveRoom(connection_id);
  if (!ctx) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::dispatch(ctx->strand, [self, ctx, connection_id, phase]() {
    if (ctx->closed) {
      return;
    }
    auto& room = ctx->room;
    if (!room.IsHost(connection_id)) {
      if (self->observability_) {
        self->observability_->LogEvent(LogLevel::kInfo, "timer.start.rejected", connection_id, room.Code());
      }
      return;
    }
    const auto timer_phase = ParseTimerPhase(phase).value_or(TimerPhase::kFocus);
    const auto duration =
        timer_phase == TimerPhase::kFocus ? self->settings_.focus_duration : self->settings_.break_duration;
    auto start = room.StartTimer(timer_phase, duration, Clock::now());

    if (self->observability_) {
      self->observability_->LogEvent(LogLevel::kInfo, "timer.started", connection_id, room.Code(),
                                     {{"phase", TimerPhaseToString(start.phase)},
                                      {"durationSeconds", start.duration.count()},
                                      {"generation", start.generation}});
    }
    self->Broadcast(ctx, events::kTimerStarted,
                    {{"endTimestamp", ToEpochMillis(start.end_at)},
                     {"phase", TimerPhaseToString(start.phase)},
                     {"durationMinutes", start.DurationMinutes()}});

    ctx->timer.Schedule(std::chrono::duration_cast<std::chrono::milliseconds>(start.duration), start.generation,
                        [self, ctx](std::uint64_t generation) { self->CompleteTimer(ctx, generation); });
  });
}

void RoomService::CompleteTimer(const std::shared_ptr<RoomContext>& ctx, std::uint64_t generation) {
  if (ctx->closed) {
    return;
  }
  auto& room = ctx->room;
  const auto phase = room.Phase();
  if (!room.CompleteTimer(generation)) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kDebug, "timer.completion.stale", std::nullopt, room.Code(),
                               {{"generation", generation}, {"current", room.TimerGeneration()}});
    }
    return;
  }
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "timer.ended", std::nullopt, room.Code(),
                             {{"phase", TimerPhaseToString(phase)}, {"generation", generation}});
  }
  Broadcast(ctx, events::kTimerEnded, {{"phase", TimerPhaseToString(phase)}});
}

void RoomService::HandleTimerStop(const std::string& connection_id) {
  auto ctx = ResolveRoom(connection_id);
  if (!ctx) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::dispatch(ctx->strand, [self, ctx, connection_id]() {
    if (ctx->closed) {
      return;
    }
    auto& room = ctx->room;
    if (!room.IsHost(connection_id)) {
      if (self->observability_) {
        self->observability_->LogEvent(LogLevel::kInfo, "timer.stop.rejected", connection_id, room.Code());
      }
      return;
    }
    room.StopTimer();
    ctx->timer.Cancel();
    if (self->observability_) {
      self->observability_->LogEvent(LogLevel::kInfo, "timer.stopped", connection_id, room.Code(),
                                     {{"generation", room.TimerGeneration()}});
    }
    self->Broadcast(ctx, events::kTimerStopped, nlohmann::json::object());
  });
}

void RoomService::HandleDistracted(const std::string& connection_id) { HandleFocusChange(connection_id, true); }

void RoomService::HandleFocused(const std::string& connection_id) { HandleFocusChange(connection_id, false); }

void RoomService::HandleFocusChange(const std::string& connection_id, bool distracted) {
  auto ctx = ResolveRoom(connection_id);
  if (!ctx) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::dispatch(ctx->strand, [self, ctx, connection_id, distracted]() {
    if (ctx->closed) {
      return;
    }
    auto& room = ctx->room;
    const auto* participant = room.FindParticipant(connection_id);
    if (!participant) {
      return;
    }
    const auto now = Clock::now();
    const bool changed = distracted ? room.MarkDistracted(connection_id, now) : room.MarkFocused(connection_id, now);
    if (changed && self->observability_) {
      self->observability_->LogEvent(LogLevel::kDebug, distracted ? "user.distracted" : "user.focused",
                                     connection_id, room.Code());
    }
    self->Broadcast(ctx, events::kUserStatusChanged,
                    {{"displayName", participant->display_name}, {"isDistracted", distracted}});

    // 경과 시간이 없어도 점수/속도를 다시 알린다.
    room.TickAndDistribute(0.0);
    self->BroadcastGroupMetrics(ctx);
  });
}

void RoomService::HandleExpressionFrame(const std::string& connection_id, const nlohmann::json& frame) {
  if (!frame.is_object()) {
    return;
  }
  auto ctx = ResolveRoom(connection_id);
  if (!ctx) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::dispatch(ctx->strand, [self, ctx, connection_id, frame]() {
    if (ctx->closed) {
      return;
    }
    auto& room = ctx->room;
    const auto* participant = room.FindParticipant(connection_id);
    if (!participant) {
      return;
    }
    const std::string display_name = participant->display_name;
    self->Broadcast(ctx, events::kExpressionFrameRelay, {{"displayName", display_name}, {"frame", frame}},
                    connection_id);

    ConfusionReading reading;
    try {
      reading = self->detector_.Evaluate(frame);
    } catch (const std::exception& ex) {
      if (self->observability_) {
        self->observability_->LogEvent(LogLevel::kWarn, "confusion.evaluate.failed", connection_id, room.Code(),
                                       {{"error", ex.what()}});
      }
      return;
    }
    if (!reading.confused) {
      return;
    }
    auto count = room.RecordConfusion(connection_id);
    if (!count) {
      return;
    }
    if (self->observability_) {
      self->observability_->LogEvent(LogLevel::kInfo, "user.confused", connection_id, room.Code(),
                                     {{"signal", reading.signal.value_or("")},
                                      {"peak", reading.peak},
                                      {"confusionEventCount", *count}});
    }
    self->Broadcast(ctx, events::kUserConfused, {{"displayName", display_name}, {"confusionEventCount", *count}});
  });
}

void RoomService::PublishRoomMetrics(const std::shared_ptr<RoomContext>& ctx) {
  Broadcast(ctx, events::kRoomState, ctx->room.Snapshot(Clock::now()));
  BroadcastGroupMetrics(ctx);
}

void RoomService::CloseAllRooms() {
  for (const auto& ctx : registry_->List()) {
    ctx->closed = true;
    ctx->timer.Cancel();
    registry_->DeleteIfSame(ctx->room.Code(), ctx.get());
  }
}

void RoomService::SendToConnection(const std::string& connection_id, const std::string& event,
                                   const nlohmann::json& payload) {
  coordinator_->SendEventToConnection(connection_id, event, payload);
}

void RoomService::Broadcast(const std::shared_ptr<RoomContext>& ctx, const std::string& event,
                            const nlohmann::json& payload, const std::optional<std::string>& exclude) {
  coordinator_->BroadcastToRoom(ctx->room.Code(), event, payload, exclude);
}

void RoomService::BroadcastGroupMetrics(const std::shared_ptr<RoomContext>& ctx) {
  Broadcast(ctx, events::kGroupScoreUpdated, {{"groupScore", ctx->room.GroupScore()}});
  Broadcast(ctx, events::kGroupDpsUpdated, {{"groupDps", ctx->room.GroupDps()}});
}

}  // namespace focusroom
