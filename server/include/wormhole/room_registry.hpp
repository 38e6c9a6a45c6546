/*
 * 설명: 살아 있는 방 테이블을 단일 락으로 보호하며 생성(충돌 재시도)/조회/열거/삭제를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "wormhole/ids.hpp"
#include "wormhole/observability.hpp"
#include "wormhole/room.hpp"
#include "wormhole/room_deletion_channel.hpp"
#include "wormhole/room_id_provider.hpp"

namespace wormhole {

// 첫 추첨 이후 허용되는 재추첨 횟수.
constexpr std::uint8_t kMaxCreateRoomIdAttempts = 5;

struct RoomRegistryConfig {
  std::chrono::milliseconds idle_timeout{kDefaultIdleTimeout};
  std::uint8_t max_id_attempts{kMaxCreateRoomIdAttempts};
};

enum class RoomCreationErrorCode { kNone, kUnableToCreateIdentifier };

struct RoomCreationError {
  RoomCreationErrorCode code{RoomCreationErrorCode::kNone};
  std::uint8_t attempts{0};

  std::string Message() const;
};

inline bool operator==(const RoomCreationError& lhs, const RoomCreationError& rhs) {
  return lhs.code == rhs.code && lhs.attempts == rhs.attempts;
}

// 테이블 락 획득 실패. 호출자가 복구할 수 있는 오류로 전달된다.
class RegistryUnavailableError : public std::runtime_error {
 public:
  explicit RegistryUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

class RoomRegistry {
 public:
  RoomRegistry(boost::asio::io_context& ioc, std::shared_ptr<Observability> observability,
               RoomRegistryConfig config = {}, std::unique_ptr<RoomIdProvider> provider = nullptr);

  std::optional<RoomId> CreateRoom(const RoomDeletionSender& deletion_sender, RoomCreationError& error);
  std::optional<RoomSnapshot> GetRoomForId(const RoomId& id) const;
  // 없는 id면 아무 일도 하지 않는다.
  void DeleteRoom(const RoomId& id);
  // 디버깅 용도. 운영 로직에서는 사용하지 않는다.
  std::vector<std::string> ListActiveRooms() const;
  std::size_t RoomCount() const;

  bool AddPlayer(const RoomId& room_id, const PlayerId& player_id);
  bool RemovePlayer(const RoomId& room_id, const PlayerId& player_id);
  bool CancelRoomDeletion(const RoomId& room_id);
  // 유휴 타이머를 처음부터 다시 건다.
  bool TouchRoom(const RoomId& room_id);

  // 모든 방을 제거하고 걸린 타이머를 취소한다. io_context가 살아 있을 때 호출해야 한다.
  void Clear();

  // true를 반환하면 테이블 락 획득이 실패한 것으로 처리한다.
  void SetLockFailureInjector(const std::function<bool()>& injector);

  const RoomRegistryConfig& GetConfig() const { return config_; }

 private:
  std::unique_lock<std::mutex> LockTable() const;

  boost::asio::io_context& ioc_;
  std::shared_ptr<Observability> observability_;
  RoomRegistryConfig config_;
  std::unique_ptr<RoomIdProvider> provider_;
  std::unordered_map<RoomId, std::unique_ptr<Room>> rooms_;
  mutable std::mutex mutex_;
  std::function<bool()> lock_failure_injector_;
  mutable std::mutex injector_mutex_;
};

}  // namespace wormhole
