/*
 * 설명: 서버 전체 수명주기와 서비스 객체 소유를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "focusroom/config.hpp"
#include "focusroom/metrics_broadcaster.hpp"
#include "focusroom/observability.hpp"
#include "focusroom/realtime.hpp"
#include "focusroom/room_registry.hpp"
#include "focusroom/room_service.hpp"
#include "focusroom/session_table.hpp"

namespace focusroom {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 호출한 스레드도 io_context를 실행하며 Stop() 이후에 반환된다.
  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<RoomRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<SessionTable> GetSessions() { return sessions_; }
  std::shared_ptr<RoomService> GetRoomService() { return room_service_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<MetricsBroadcaster> GetMetricsBroadcaster() { return metrics_broadcaster_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void JoinWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<SessionTable> sessions_;
  std::shared_ptr<RoomService> room_service_;
  std::shared_ptr<MetricsBroadcaster> metrics_broadcaster_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace focusroom
