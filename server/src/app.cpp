/*
 * 설명: 서버 수명주기, 리스닝 소켓, 워커 스레드와 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "focusroom/app.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <type_traits>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "focusroom/http_session.hpp"

namespace focusroom {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<RoomService> room_service,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), coordinator_(std::move(coordinator)),
        room_service_(std::move(room_service)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    auto self = shared_from_this();
    boost::asio::post(acceptor_.get_executor(), [self]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->coordinator_, self->room_service_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RoomService> room_service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  coordinator_ = std::make_shared<RealtimeCoordinator>();
  coordinator_->SetObservability(observability_);
  ScoringConfig scoring{.base_rate_per_second = config.base_rate_per_second,
                        .penalty_per_distracted = config.penalty_per_distracted};
  registry_ = std::make_shared<RoomRegistry>(ioc_, scoring);
  sessions_ = std::make_shared<SessionTable>();
  RoomSettings settings{.focus_duration = std::chrono::seconds(config.focus_duration_seconds),
                        .break_duration = std::chrono::seconds(config.break_duration_seconds)};
  room_service_ = std::make_shared<RoomService>(registry_, sessions_, coordinator_, observability_, settings);
  metrics_broadcaster_ = std::make_shared<MetricsBroadcaster>(
      ioc_, registry_, room_service_, observability_, std::chrono::milliseconds(config.metrics_interval_ms));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, room_service_, observability_);
    listener_->Run();
    metrics_broadcaster_->Start();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->LogEvent(LogLevel::kInfo, "server.signal", std::nullopt, std::nullopt,
                               {{"signal", signal_number}});
      Stop();
    });
    observability_->LogEvent(LogLevel::kInfo, "server.start", std::nullopt, std::nullopt,
                             {{"port", config_.port}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
  JoinWorkers();
  // 모든 핸들러가 끝난 뒤이므로 스트랜드 없이 정리한다.
  room_service_->CloseAllRooms();
  observability_->LogEvent(LogLevel::kInfo, "server.stop", std::nullopt, std::nullopt);
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  metrics_broadcaster_->Stop();
  boost::system::error_code ignored;
  signals_.cancel(ignored);
  if (listener_) {
    listener_->Stop();
  }
  work_guard_.reset();
  ioc_.stop();
}

namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

// 해석할 수 없거나 음수, 무한대/NaN, 범위를 벗어난 값은 기본값으로 대체한다.
template <typename T>
T ParseOr(const std::string& text, T def) {
  try {
    std::size_t idx = 0;
    if constexpr (std::is_floating_point_v<T>) {
      auto parsed = std::stod(text, &idx);
      if (idx != text.size() || !std::isfinite(parsed) || parsed < 0) {
        return def;
      }
      return static_cast<T>(parsed);
    } else {
      if (!text.empty() && text.front() == '-') {
        return def;
      }
      auto parsed = std::stoull(text, &idx);
      if (idx != text.size() || parsed > std::numeric_limits<T>::max()) {
        return def;
      }
      return static_cast<T>(parsed);
    }
  } catch (const std::exception&) {
    return def;
  }
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  cfg.port = ParseOr<unsigned short>(GetEnv("SERVER_PORT", "3001"), 3001);
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.focus_duration_seconds = ParseOr<std::size_t>(GetEnv("FOCUS_DURATION_SECONDS", "1500"), 1500);
  cfg.break_duration_seconds = ParseOr<std::size_t>(GetEnv("BREAK_DURATION_SECONDS", "300"), 300);
  cfg.base_rate_per_second = ParseOr<double>(GetEnv("BASE_RATE_PER_SECOND", "10.0"), 10.0);
  cfg.penalty_per_distracted = ParseOr<double>(GetEnv("PENALTY_PER_DISTRACTED", "0.1"), 0.1);
  cfg.metrics_interval_ms = ParseOr<std::size_t>(GetEnv("METRICS_INTERVAL_MS", "1000"), 1000);
  cfg.ws_queue_limit_messages = ParseOr<std::size_t>(GetEnv("WS_QUEUE_LIMIT_MESSAGES", "64"), 64);
  cfg.ws_queue_limit_bytes = ParseOr<std::size_t>(GetEnv("WS_QUEUE_LIMIT_BYTES", "262144"), 262144);
  return cfg;
}

}  // namespace focusroom
