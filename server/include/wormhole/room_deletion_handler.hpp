/*
 * 설명: 삭제 채널을 단일 소비자로 감시하며 요청된 방을 레지스트리에서 제거한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_deletion_handler_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>

#include "wormhole/observability.hpp"
#include "wormhole/room_deletion_channel.hpp"
#include "wormhole/room_registry.hpp"

namespace wormhole {

class RoomDeletionHandler {
 public:
  RoomDeletionHandler(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<Observability> observability,
                      std::size_t channel_capacity = kDefaultDeletionChannelCapacity);

  // 방 생성 시 넘겨줄 송신 핸들.
  RoomDeletionSender Sender() const { return RoomDeletionSender(channel_); }

  // Stop()으로 채널이 닫히고 남은 요청을 모두 처리할 때까지 블록된다.
  void Watch();
  void Stop();

  std::size_t ProcessedCount() const { return processed_.load(); }
  // 레지스트리 락 실패로 버려진 요청 수.
  std::size_t FailedCount() const { return failed_.load(); }

 private:
  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RoomDeletionChannel> channel_;
  std::atomic<std::size_t> processed_{0};
  std::atomic<std::size_t> failed_{0};
};

}  // namespace wormhole
