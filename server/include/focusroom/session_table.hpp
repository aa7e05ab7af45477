/*
 * 설명: 연결 ID를 소속 룸 코드와 표시 이름으로 매핑한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_session_test.cpp
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace focusroom {

struct SessionEntry {
  std::string room_code;
  std::string display_name;
};

class SessionTable {
 public:
  void Put(const std::string& connection_id, const SessionEntry& entry);
  // 새 항목을 기록하고 이전 항목을 돌려준다.
  std::optional<SessionEntry> Exchange(const std::string& connection_id, const SessionEntry& entry);
  std::optional<SessionEntry> Find(const std::string& connection_id) const;
  std::optional<SessionEntry> Remove(const std::string& connection_id);
  // 다른 룸으로 옮겨간 연결의 항목은 지우지 않는다.
  bool RemoveIf(const std::string& connection_id, const std::string& room_code);
  std::size_t Size() const;

 private:
  std::unordered_map<std::string, SessionEntry> entries_;
  mutable std::mutex mutex_;
};

}  // namespace focusroom
