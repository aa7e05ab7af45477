/*
 * 설명: 연결별 세션 항목의 등록/조회/삭제를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_session_test.cpp
 */
#include "focusroom/session_table.hpp"

namespace focusroom {

void SessionTable::Put(const std::string& connection_id, const SessionEntry& entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[connection_id] = entry;
}

std::optional<SessionEntry> SessionTable::Exchange(const std::string& connection_id, const SessionEntry& entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<SessionEntry> previous;
  auto it = entries_.find(connection_id);
  if (it != entries_.end()) {
    previous = it->second;
    it->second = entry;
  } else {
    entries_.emplace(connection_id, entry);
  }
  return previous;
}

std::optional<SessionEntry> SessionTable::Find(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(connection_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<SessionEntry> SessionTable::Remove(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(connection_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  auto entry = it->second;
  entries_.erase(it);
  return entry;
}

bool SessionTable::RemoveIf(const std::string& connection_id, const std::string& room_code) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(connection_id);
  if (it == entries_.end() || it->second.room_code != room_code) {
    return false;
  }
  entries_.erase(it);
  return true;
}

std::size_t SessionTable::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace focusroom
