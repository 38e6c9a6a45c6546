/*
 * 설명: 유휴 타이머가 방 삭제를 요청할 때 쓰는 용량 제한 채널과 송신 핸들을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_deletion_channel_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "wormhole/ids.hpp"

namespace wormhole {

constexpr std::size_t kDefaultDeletionChannelCapacity = 100;

// 가득 차면 Send가 블록된다. 요청을 버리지 않는다.
class RoomDeletionChannel {
 public:
  explicit RoomDeletionChannel(std::size_t capacity = kDefaultDeletionChannelCapacity);

  // 닫힌 채널이면 false를 반환한다.
  bool Send(const RoomId& room_id);
  // 채널이 닫히고 비워지면 nullopt를 반환한다.
  std::optional<RoomId> Receive();
  std::optional<RoomId> ReceiveFor(std::chrono::milliseconds timeout);
  void Close();

  bool IsClosed() const;
  std::size_t Size() const;
  std::size_t Capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  std::deque<RoomId> queue_;
  bool closed_{false};
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
};

class RoomDeletionSender {
 public:
  RoomDeletionSender() = default;
  explicit RoomDeletionSender(std::shared_ptr<RoomDeletionChannel> channel) : channel_(std::move(channel)) {}

  bool Send(const RoomId& room_id) const;
  bool IsBound() const { return channel_ != nullptr; }

 private:
  std::shared_ptr<RoomDeletionChannel> channel_;
};

}  // namespace wormhole
