/*
 * 설명: 주기 틱마다 룸별 스트랜드로 점수 누적과 전파 작업을 나눠 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_service_it_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "focusroom/metrics_broadcaster.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace focusroom {

MetricsBroadcaster::MetricsBroadcaster(boost::asio::io_context& ioc, std::shared_ptr<RoomRegistry> registry,
                                       std::shared_ptr<RoomService> room_service,
                                       std::shared_ptr<Observability> observability,
                                       std::chrono::milliseconds interval)
    : strand_(boost::asio::make_strand(ioc)), timer_(strand_), registry_(std::move(registry)),
      room_service_(std::move(room_service)), observability_(std::move(observability)),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)) {}

void MetricsBroadcaster::Start() {
  if (running_.exchange(true)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::dispatch(strand_, [self]() {
    self->timer_.expires_after(self->interval_);
    self->timer_.async_wait(boost::asio::bind_executor(
        self->strand_, [self](const boost::system::error_code& ec) { self->OnTick(ec); }));
  });
}

void MetricsBroadcaster::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() { self->timer_.cancel(); });
}

void MetricsBroadcaster::ScheduleNext() {
  // 처리 시간과 무관하게 주기를 유지하도록 직전 만료 시각을 기준으로 잡는다.
  timer_.expires_at(timer_.expiry() + interval_);
  auto self = shared_from_this();
  timer_.async_wait(
      boost::asio::bind_executor(strand_, [self](const boost::system::error_code& ec) { self->OnTick(ec); }));
}

void MetricsBroadcaster::OnTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  ++tick_count_;
  if (observability_) {
    observability_->IncrementMetricsTick();
  }
  const double seconds = std::chrono::duration<double>(interval_).count();
  for (const auto& ctx : registry_->List()) {
    TickRoom(ctx, seconds);
  }
  ScheduleNext();
}

void MetricsBroadcaster::TickRoom(const std::shared_ptr<RoomContext>& ctx, double seconds) {
  auto self = shared_from_this();
  boost::asio::dispatch(ctx->strand, [self, ctx, seconds]() {
    if (ctx->closed) {
      return;
    }
    // 한 룸의 실패가 다른 룸이나 다음 틱을 막지 않는다.
    try {
      ctx->room.TickAndDistribute(seconds);
      self->room_service_->PublishRoomMetrics(ctx);
    } catch (const std::exception& ex) {
      if (self->observability_) {
        self->observability_->LogEvent(LogLevel::kError, "metrics.tick.failed", std::nullopt, ctx->room.Code(),
                                       {{"error", ex.what()}});
      }
    }
  });
}

}  // namespace focusroom
