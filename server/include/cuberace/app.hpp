/*
 * 설명: 서버 전체 수명주기(맵 카탈로그 로딩, 경주 서비스, 리스너, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
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

#include "cuberace/config.hpp"
#include "cuberace/observability.hpp"
#include "cuberace/race_service.hpp"
#include "cuberace/realtime.hpp"

namespace cuberace {

class Listener;

class ServerApp {
 public:
  // 맵 디렉터리가 잘못되면 MapLoadError를 던진다.
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<RaceService> GetRaceService() { return race_service_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<RaceService> race_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace cuberace
