/*
 * 설명: 플레이어 집합을 소유하고 유휴 시간 초과 시 스스로 삭제를 요청하는 방 엔티티를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "wormhole/ids.hpp"
#include "wormhole/observability.hpp"
#include "wormhole/room_deletion_channel.hpp"

namespace wormhole {

constexpr std::chrono::milliseconds kDefaultIdleTimeout{std::chrono::seconds(30)};

enum class DeletionState { kUnarmed, kArmed, kFired };

const char* ToString(DeletionState state);

struct RoomSnapshot {
  RoomId id;
  std::vector<PlayerId> players;
  DeletionState deletion_state{DeletionState::kUnarmed};
};

// 방은 생성 즉시 유휴 타이머를 건다. 타이머는 레지스트리에 접근하지 않고
// 삭제 채널로 자신의 id만 보낸다.
class Room {
 public:
  Room(RoomId id, RoomDeletionSender deletion_sender, boost::asio::io_context& ioc,
       std::shared_ptr<Observability> observability, std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout);
  ~Room();

  Room(const Room&) = delete;
  Room& operator=(const Room&) = delete;

  const RoomId& Id() const { return id_; }
  std::chrono::milliseconds IdleTimeout() const { return idle_timeout_; }

  // 이미 걸린 타이머가 있으면 취소하고 새로 건다.
  void ScheduleDeletion();
  void CancelDeletion();
  DeletionState GetDeletionState() const;

  bool AddPlayer(const PlayerId& player_id);
  bool RemovePlayer(const PlayerId& player_id);
  bool HasPlayer(const PlayerId& player_id) const { return players_.count(player_id) > 0; }
  std::size_t PlayerCount() const { return players_.size(); }

  RoomSnapshot Snapshot() const;

 private:
  struct DeletionTimer {
    explicit DeletionTimer(boost::asio::io_context& ioc) : strand(boost::asio::make_strand(ioc)), timer(ioc) {}

    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    boost::asio::steady_timer timer;
    std::atomic<DeletionState> state{DeletionState::kArmed};
  };

  void AbortTimer();
  static void OnTimerExpired(const std::shared_ptr<DeletionTimer>& deletion_timer, const boost::system::error_code& ec,
                             RoomId id, const RoomDeletionSender& sender,
                             const std::shared_ptr<Observability>& observability);

  RoomId id_;
  RoomDeletionSender deletion_sender_;
  boost::asio::io_context& ioc_;
  std::shared_ptr<Observability> observability_;
  std::chrono::milliseconds idle_timeout_;
  std::shared_ptr<DeletionTimer> deletion_timer_;
  std::unordered_set<PlayerId> players_;
};

}  // namespace wormhole
