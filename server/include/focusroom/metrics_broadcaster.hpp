/*
 * 설명: 고정 주기로 모든 룸의 점수를 누적하고 상태/점수/속도를 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_service_it_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "focusroom/observability.hpp"
#include "focusroom/room_registry.hpp"
#include "focusroom/room_service.hpp"

namespace focusroom {

class MetricsBroadcaster : public std::enable_shared_from_this<MetricsBroadcaster> {
 public:
  MetricsBroadcaster(boost::asio::io_context& ioc, std::shared_ptr<RoomRegistry> registry,
                     std::shared_ptr<RoomService> room_service, std::shared_ptr<Observability> observability,
                     std::chrono::milliseconds interval);

  void Start();
  void Stop();
  std::uint64_t TickCount() const { return tick_count_.load(); }

 private:
  void ScheduleNext();
  void OnTick(const boost::system::error_code& ec);
  void TickRoom(const std::shared_ptr<RoomContext>& ctx, double seconds);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<RoomService> room_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::milliseconds interval_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> tick_count_{0};
};

}  // namespace focusroom
