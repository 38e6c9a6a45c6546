/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/rooms_api_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "wormhole/config.hpp"
#include "wormhole/observability.hpp"
#include "wormhole/room_deletion_handler.hpp"
#include "wormhole/room_registry.hpp"

namespace wormhole {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // SIGINT/SIGTERM을 받거나 Stop()이 호출될 때까지 현재 스레드에서 io_context를 실행한다.
  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<RoomRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<RoomDeletionHandler> GetDeletionHandler() { return deletion_handler_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  // 스레드 join 없이 종료만 요청한다. io_context 핸들러 안에서도 호출할 수 있다.
  void RequestStop();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::signal_set signals_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<RoomDeletionHandler> deletion_handler_;
  std::shared_ptr<Listener> listener_;
  std::thread deletion_thread_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace wormhole
