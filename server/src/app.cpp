/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리하고 환경설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/race_flow_test.cpp
 */
#include "cuberace/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "cuberace/http_session.hpp"
#include "cuberace/map_definition.hpp"

namespace cuberace {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<RaceService> race_service,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), coordinator_(std::move(coordinator)),
        race_service_(std::move(race_service)), observability_(std::move(observability)) {
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
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->coordinator_, self->race_service_,
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
  std::shared_ptr<RaceService> race_service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  coordinator_ = std::make_shared<RealtimeCoordinator>();
  coordinator_->SetObservability(observability_);
  auto catalog = MapCatalog::LoadDirectory(config.map_dir, TeamIds(DefaultTeams()));
  RaceTiming timing;
  timing.tick_interval = std::chrono::milliseconds(config.tick_interval_ms);
  timing.command_cooldown = std::chrono::milliseconds(config.command_cooldown_ms);
  timing.reset_delay = std::chrono::milliseconds(config.reset_delay_ms);
  race_service_ = std::make_shared<RaceService>(ioc_, coordinator_, observability_, std::move(catalog), timing);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, race_service_, observability_);
    listener_->Run();
    race_service_->Start();
    std::cout << "서버 시작: 포트 " << config_.port << ", 맵 디렉터리 " << config_.map_dir << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  race_service_->Stop();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "3000")));
  cfg.map_dir = get_env("MAP_DIR", "maps");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.tick_interval_ms = static_cast<std::size_t>(std::stoul(get_env("TICK_INTERVAL_MS", "300")));
  if (cfg.tick_interval_ms == 0) {
    throw std::invalid_argument("TICK_INTERVAL_MS는 0보다 커야 한다");
  }
  cfg.command_cooldown_ms = static_cast<std::size_t>(std::stoul(get_env("COMMAND_COOLDOWN_MS", "1000")));
  cfg.reset_delay_ms = static_cast<std::size_t>(std::stoul(get_env("RESET_DELAY_MS", "3000")));
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "262144")));
  return cfg;
}

}  // namespace cuberace
