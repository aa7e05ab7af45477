/*
 * 설명: 룸 레지스트리의 지연 생성과 동일 인스턴스 삭제를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_session_test.cpp, server/tests/it/room_service_it_test.cpp
 */
#include "focusroom/room_registry.hpp"

namespace focusroom {

RoomRegistry::RoomRegistry(boost::asio::io_context& ioc, const ScoringConfig& scoring)
    : ioc_(ioc), scoring_(scoring) {}

std::shared_ptr<RoomContext> RoomRegistry::GetOrCreate(const std::string& code) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(code);
  if (it != rooms_.end()) {
    return it->second;
  }
  auto ctx = std::make_shared<RoomContext>(ioc_, code, scoring_);
  rooms_.emplace(code, ctx);
  return ctx;
}

std::shared_ptr<RoomContext> RoomRegistry::Get(const std::string& code) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(code);
  if (it == rooms_.end()) {
    return nullptr;
  }
  return it->second;
}

void RoomRegistry::Delete(const std::string& code) {
  std::lock_guard<std::mutex> lock(mutex_);
  rooms_.erase(code);
}

bool RoomRegistry::DeleteIfSame(const std::string& code, const RoomContext* ctx) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(code);
  if (it == rooms_.end() || it->second.get() != ctx) {
    return false;
  }
  rooms_.erase(it);
  return true;
}

std::vector<std::shared_ptr<RoomContext>> RoomRegistry::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<RoomContext>> result;
  result.reserve(rooms_.size());
  for (const auto& entry : rooms_) {
    result.push_back(entry.second);
  }
  return result;
}

std::size_t RoomRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rooms_.size();
}

}  // namespace focusroom
