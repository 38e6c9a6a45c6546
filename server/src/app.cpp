/*
 * 설명: 서버 수명주기와 리스닝/삭제 처리 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/rooms_api_test.cpp, server/tests/unit/config_test.cpp
 */
#include "wormhole/app.hpp"

#include <algorithm>
#include <csignal>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "wormhole/http_session.hpp"

namespace wormhole {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<RoomRegistry> registry, RoomDeletionSender deletion_sender,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), registry_(std::move(registry)),
        deletion_sender_(std::move(deletion_sender)), observability_(std::move(observability)) {
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
            std::make_shared<HttpSession>(std::move(socket), self->registry_, self->deletion_sender_,
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
  std::shared_ptr<RoomRegistry> registry_;
  RoomDeletionSender deletion_sender_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), signals_(ioc_, SIGINT, SIGTERM), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  RoomRegistryConfig registry_config;
  registry_config.idle_timeout = std::chrono::seconds(config.room_idle_timeout_seconds);
  registry_config.max_id_attempts = static_cast<std::uint8_t>(config.room_id_max_attempts);
  registry_ = std::make_shared<RoomRegistry>(ioc_, observability_, registry_config);
  deletion_handler_ =
      std::make_shared<RoomDeletionHandler>(registry_, observability_, config.deletion_channel_capacity);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    deletion_thread_ = std::thread([handler = deletion_handler_]() { handler->Watch(); });
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(config_.host), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, registry_, deletion_handler_->Sender(), observability_);
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Event(LogLevel::kInfo, "server.signal_received", {{"signal", signal_number}});
      RequestStop();
    });
    observability_->Event(LogLevel::kInfo, "server.started", {{"host", config_.host}, {"port", config_.port}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kError, "server.run_failed", {{"error", ex.what()}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::RequestStop() {
  // 채널을 먼저 닫아야 가득 찬 채널에서 블록된 타이머 핸들러가 풀린다.
  deletion_handler_->Stop();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  RequestStop();
  boost::system::error_code ec;
  signals_.cancel(ec);
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  if (deletion_thread_.joinable()) {
    deletion_thread_.join();
  }
  // 대기 중인 세션 핸들러가 레지스트리를 늦게 해제해도 남은 방 타이머가 없도록 비운다.
  registry_->Clear();
  observability_->Event(LogLevel::kInfo, "server.stopped");
}

namespace {
std::size_t ParseUnsignedEnv(const char* key, const std::string& value, std::size_t min, std::size_t max) {
  std::size_t idx = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &idx);
  } catch (const std::exception&) {
    idx = 0;
  }
  if (value.empty() || idx != value.size() || value[0] == '-' || parsed < min || parsed > max) {
    throw std::invalid_argument(std::string("환경 변수 ") + key + "의 값이 올바르지 않습니다: " + value);
  }
  return static_cast<std::size_t>(parsed);
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.host = get_env(kHostEnvVar, kDefaultHost);
  cfg.port = static_cast<unsigned short>(ParseUnsignedEnv(
      kPortEnvVar, get_env(kPortEnvVar, std::to_string(kDefaultPort).c_str()), 0,
      std::numeric_limits<unsigned short>::max()));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.room_idle_timeout_seconds =
      ParseUnsignedEnv("ROOM_IDLE_TIMEOUT_SECONDS", get_env("ROOM_IDLE_TIMEOUT_SECONDS", "30"), 1,
                       std::numeric_limits<std::uint32_t>::max());
  cfg.room_id_max_attempts = ParseUnsignedEnv("ROOM_ID_MAX_ATTEMPTS", get_env("ROOM_ID_MAX_ATTEMPTS", "5"), 0,
                                              std::numeric_limits<std::uint8_t>::max());
  cfg.deletion_channel_capacity = ParseUnsignedEnv(
      "ROOM_DELETION_CHANNEL_CAPACITY", get_env("ROOM_DELETION_CHANNEL_CAPACITY", "100"), 1, 1'000'000);
  return cfg;
}

}  // namespace wormhole
