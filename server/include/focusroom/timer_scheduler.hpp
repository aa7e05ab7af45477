/*
 * 설명: 룸 스트랜드에 묶인 지연 완료 작업을 예약하고 추적한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_service_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace focusroom {

using RoomStrand = boost::asio::strand<boost::asio::io_context::executor_type>;

class TimerScheduler {
 public:
  using Completion = std::function<void(std::uint64_t generation)>;

  explicit TimerScheduler(const RoomStrand& strand);

  // 이전에 예약된 대기는 취소되며, 늦게 도착한 완료는 세대 비교로 걸러진다.
  void Schedule(std::chrono::milliseconds delay, std::uint64_t generation, Completion on_fire);
  void Cancel();

 private:
  RoomStrand strand_;
  boost::asio::steady_timer timer_;
};

}  // namespace focusroom
