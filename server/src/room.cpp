/*
 * 설명: 방의 유휴 삭제 타이머 예약/취소와 플레이어 집합 관리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_test.cpp
 */
#include "wormhole/room.hpp"

#include <algorithm>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>

namespace wormhole {

const char* ToString(DeletionState state) {
  switch (state) {
    case DeletionState::kUnarmed:
      return "unarmed";
    case DeletionState::kArmed:
      return "armed";
    case DeletionState::kFired:
      return "fired";
  }
  return "unarmed";
}

Room::Room(RoomId id, RoomDeletionSender deletion_sender, boost::asio::io_context& ioc,
           std::shared_ptr<Observability> observability, std::chrono::milliseconds idle_timeout)
    : id_(id), deletion_sender_(std::move(deletion_sender)), ioc_(ioc), observability_(std::move(observability)),
      idle_timeout_(idle_timeout) {
  ScheduleDeletion();
}

Room::~Room() { AbortTimer(); }

void Room::ScheduleDeletion() {
  AbortTimer();
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "room.scheduling_deletion",
                          {{"roomId", id_.ToString()}, {"timeoutMs", idle_timeout_.count()}});
  }

  auto deletion_timer = std::make_shared<DeletionTimer>(ioc_);
  deletion_timer_ = deletion_timer;
  // 타이머 객체에 대한 모든 조작은 해당 strand 위에서만 수행한다.
  boost::asio::dispatch(deletion_timer->strand, [deletion_timer, id = id_, sender = deletion_sender_,
                                                 observability = observability_, timeout = idle_timeout_]() {
    if (deletion_timer->state.load() != DeletionState::kArmed) {
      return;
    }
    deletion_timer->timer.expires_after(timeout);
    deletion_timer->timer.async_wait(boost::asio::bind_executor(
        deletion_timer->strand, [deletion_timer, id, sender, observability](const boost::system::error_code& ec) {
          OnTimerExpired(deletion_timer, ec, id, sender, observability);
        }));
  });
}

void Room::OnTimerExpired(const std::shared_ptr<DeletionTimer>& deletion_timer, const boost::system::error_code& ec,
                          RoomId id, const RoomDeletionSender& sender,
                          const std::shared_ptr<Observability>& observability) {
  if (ec == boost::asio::error::operation_aborted) {
    return;
  }
  if (ec) {
    if (observability) {
      observability->Event(LogLevel::kError, "room.deletion_timer_error",
                           {{"roomId", id.ToString()}, {"error", ec.message()}});
    }
    return;
  }
  auto expected = DeletionState::kArmed;
  if (!deletion_timer->state.compare_exchange_strong(expected, DeletionState::kFired)) {
    return;
  }

  if (observability) {
    observability->Event(LogLevel::kInfo, "room.requesting_deletion", {{"roomId", id.ToString()}});
  }
  // 채널이 가득 차면 여기서 블록된다.
  bool sent = sender.Send(id);
  if (observability) {
    if (sent) {
      observability->IncrementDeletionRequests();
    }
    observability->Event(sent ? LogLevel::kInfo : LogLevel::kWarn, "room.deletion_request_result",
                         {{"roomId", id.ToString()}, {"result", sent ? "sent" : "closed"}});
  }
}

void Room::CancelDeletion() {
  if (!deletion_timer_) {
    if (observability_) {
      observability_->Event(LogLevel::kWarn, "room.cancel_deletion.invalid", {{"roomId", id_.ToString()}});
    }
    return;
  }
  if (observability_) {
    observability_->Event(LogLevel::kInfo, "room.cancel_deletion.valid", {{"roomId", id_.ToString()}});
  }
  AbortTimer();
}

void Room::AbortTimer() {
  if (!deletion_timer_) {
    return;
  }
  auto deletion_timer = std::move(deletion_timer_);
  // 이미 발화한 타이머의 요청은 회수하지 않는다.
  auto expected = DeletionState::kArmed;
  deletion_timer->state.compare_exchange_strong(expected, DeletionState::kUnarmed);
  boost::asio::dispatch(deletion_timer->strand, [deletion_timer]() { deletion_timer->timer.cancel(); });
}

DeletionState Room::GetDeletionState() const {
  if (!deletion_timer_) {
    return DeletionState::kUnarmed;
  }
  return deletion_timer_->state.load();
}

bool Room::AddPlayer(const PlayerId& player_id) { return players_.insert(player_id).second; }

bool Room::RemovePlayer(const PlayerId& player_id) { return players_.erase(player_id) > 0; }

RoomSnapshot Room::Snapshot() const {
  RoomSnapshot snapshot;
  snapshot.id = id_;
  snapshot.players.assign(players_.begin(), players_.end());
  std::sort(snapshot.players.begin(), snapshot.players.end());
  snapshot.deletion_state = GetDeletionState();
  return snapshot;
}

}  // namespace wormhole
