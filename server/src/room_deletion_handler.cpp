/*
 * 설명: 삭제 요청을 수신 순서대로 처리해 레지스트리 변경을 한 소비자로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_deletion_handler_test.cpp
 */
#include "wormhole/room_deletion_handler.hpp"

namespace wormhole {

RoomDeletionHandler::RoomDeletionHandler(std::shared_ptr<RoomRegistry> registry,
                                         std::shared_ptr<Observability> observability, std::size_t channel_capacity)
    : registry_(std::move(registry)),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>()),
      channel_(std::make_shared<RoomDeletionChannel>(channel_capacity)) {}

void RoomDeletionHandler::Watch() {
  observability_->Event(LogLevel::kInfo, "room_deletion_handler.watch_started",
                        {{"capacity", channel_->Capacity()}});
  while (auto room_id = channel_->Receive()) {
    try {
      registry_->DeleteRoom(*room_id);
      processed_.fetch_add(1);
    } catch (const RegistryUnavailableError& ex) {
      failed_.fetch_add(1);
      observability_->Event(LogLevel::kError, "room_deletion_handler.registry_unavailable",
                            {{"roomId", room_id->ToString()}, {"error", ex.what()}});
    }
  }
  observability_->Event(LogLevel::kInfo, "room_deletion_handler.watch_stopped",
                        {{"processed", processed_.load()}, {"failed", failed_.load()}});
}

void RoomDeletionHandler::Stop() { channel_->Close(); }

}  // namespace wormhole
