/*
 * 설명: 삭제 요청 채널의 블로킹 송수신과 종료 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_deletion_channel_test.cpp
 */
#include "wormhole/room_deletion_channel.hpp"

#include <stdexcept>

namespace wormhole {

RoomDeletionChannel::RoomDeletionChannel(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("삭제 채널 용량은 1 이상이어야 합니다");
  }
}

bool RoomDeletionChannel::Send(const RoomId& room_id) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_full_.wait(lock, [this]() { return closed_ || queue_.size() < capacity_; });
  if (closed_) {
    return false;
  }
  queue_.push_back(room_id);
  lock.unlock();
  not_empty_.notify_one();
  return true;
}

std::optional<RoomId> RoomDeletionChannel::Receive() {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
  if (queue_.empty()) {
    return std::nullopt;
  }
  RoomId room_id = queue_.front();
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return room_id;
}

std::optional<RoomId> RoomDeletionChannel::ReceiveFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!not_empty_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); })) {
    return std::nullopt;
  }
  if (queue_.empty()) {
    return std::nullopt;
  }
  RoomId room_id = queue_.front();
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return room_id;
}

void RoomDeletionChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool RoomDeletionChannel::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t RoomDeletionChannel::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool RoomDeletionSender::Send(const RoomId& room_id) const {
  if (!channel_) {
    return false;
  }
  return channel_->Send(room_id);
}

}  // namespace wormhole
