/*
 * 설명: 룸 코드별 룸 컨텍스트(상태, 스트랜드, 타이머)를 생성/조회/삭제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_session_test.cpp, server/tests/it/room_service_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "focusroom/room.hpp"
#include "focusroom/timer_scheduler.hpp"

namespace focusroom {

// room, timer, closed 는 strand 위에서만 접근한다.
struct RoomContext {
  RoomContext(boost::asio::io_context& ioc, const std::string& code, const ScoringConfig& scoring)
      : room(code, scoring), strand(boost::asio::make_strand(ioc)), timer(strand) {}

  Room room;
  RoomStrand strand;
  TimerScheduler timer;
  bool closed{false};
};

class RoomRegistry {
 public:
  RoomRegistry(boost::asio::io_context& ioc, const ScoringConfig& scoring);

  std::shared_ptr<RoomContext> GetOrCreate(const std::string& code);
  std::shared_ptr<RoomContext> Get(const std::string& code) const;
  void Delete(const std::string& code);
  bool DeleteIfSame(const std::string& code, const RoomContext* ctx);
  std::vector<std::shared_ptr<RoomContext>> List() const;
  std::size_t Size() const;
  const ScoringConfig& Scoring() const { return scoring_; }

 private:
  boost::asio::io_context& ioc_;
  ScoringConfig scoring_;
  std::unordered_map<std::string, std::shared_ptr<RoomContext>> rooms_;
  mutable std::mutex mutex_;
};

}  // namespace focusroom
