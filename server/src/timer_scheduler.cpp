/*
 * 설명: steady_timer 기반 지연 완료 예약과 취소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/room_service_it_test.cpp
 */
#include "focusroom/timer_scheduler.hpp"

#include <boost/asio/bind_executor.hpp>

namespace focusroom {

TimerScheduler::TimerScheduler(const RoomStrand& strand) : strand_(strand), timer_(strand) {}

void TimerScheduler::Schedule(std::chrono::milliseconds delay, std::uint64_t generation, Completion on_fire) {
  timer_.expires_after(delay);
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [generation, on_fire = std::move(on_fire)](const boost::system::error_code& ec) {
        if (ec) {
          return;
        }
        on_fire(generation);
      }));
}

void TimerScheduler::Cancel() {
  timer_.cancel();
}

}  // namespace focusroom
