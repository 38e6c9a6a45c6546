/*
 * 설명: 방 생성 시 식별자 충돌을 제한된 횟수만큼 재시도하고 방 테이블을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp, server/tests/unit/room_deletion_handler_test.cpp
 */
#include "wormhole/room_registry.hpp"

#include <sstream>
#include <system_error>

namespace wormhole {

std::string RoomCreationError::Message() const {
  switch (code) {
    case RoomCreationErrorCode::kUnableToCreateIdentifier: {
      std::ostringstream oss;
      oss << "고유한 방 식별자를 " << static_cast<int>(attempts) << "회 시도 후에도 만들지 못했습니다";
      return oss.str();
    }
    case RoomCreationErrorCode::kNone:
      break;
  }
  return "";
}

RoomRegistry::RoomRegistry(boost::asio::io_context& ioc, std::shared_ptr<Observability> observability,
                           RoomRegistryConfig config, std::unique_ptr<RoomIdProvider> provider)
    : ioc_(ioc), observability_(observability ? std::move(observability) : std::make_shared<Observability>()),
      config_(config), provider_(provider ? std::move(provider) : std::make_unique<RandomRoomIdProvider>()) {}

void RoomRegistry::SetLockFailureInjector(const std::function<bool()>& injector) {
  std::lock_guard<std::mutex> lock(injector_mutex_);
  lock_failure_injector_ = injector;
}

std::unique_lock<std::mutex> RoomRegistry::LockTable() const {
  try {
    {
      std::lock_guard<std::mutex> lock(injector_mutex_);
      if (lock_failure_injector_ && lock_failure_injector_()) {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
      }
    }
    return std::unique_lock<std::mutex>(mutex_);
  } catch (const std::system_error& ex) {
    throw RegistryUnavailableError(std::string("방 테이블 락을 획득하지 못했습니다: ") + ex.what());
  }
}

std::optional<RoomId> RoomRegistry::CreateRoom(const RoomDeletionSender& deletion_sender, RoomCreationError& error) {
  auto lock = LockTable();
  RoomId id = provider_->ProvideId();
  std::uint8_t attempts = 0;
  while (rooms_.count(id) > 0) {
    if (attempts >= config_.max_id_attempts) {
      observability_->Event(LogLevel::kWarn, "room_registry.room_creation_error",
                            {{"currentRoomCount", rooms_.size()}, {"attempts", attempts}});
      error = RoomCreationError{RoomCreationErrorCode::kUnableToCreateIdentifier, config_.max_id_attempts};
      return std::nullopt;
    }
    ++attempts;
    id = provider_->ProvideId();
  }

  auto room = std::make_unique<Room>(id, deletion_sender, ioc_, observability_, config_.idle_timeout);
  rooms_.emplace(id, std::move(room));
  observability_->IncrementRoomsCreated();
  observability_->Event(LogLevel::kInfo, "room_registry.room_created", {{"roomId", id.ToString()}});
  return id;
}

std::optional<RoomSnapshot> RoomRegistry::GetRoomForId(const RoomId& id) const {
  auto lock = LockTable();
  observability_->Event(LogLevel::kDebug, "room_registry.get_room_for_id", {{"roomId", id.ToString()}});
  auto it = rooms_.find(id);
  if (it == rooms_.end()) {
    return std::nullopt;
  }
  return it->second->Snapshot();
}

void RoomRegistry::DeleteRoom(const RoomId& id) {
  auto lock = LockTable();
  observability_->Event(LogLevel::kInfo, "room_registry.deleting_room", {{"roomId", id.ToString()}});
  if (rooms_.erase(id) > 0) {
    observability_->IncrementRoomsDeleted();
  }
}

std::vector<std::string> RoomRegistry::ListActiveRooms() const {
  auto lock = LockTable();
  std::vector<std::string> ids;
  ids.reserve(rooms_.size());
  for (const auto& entry : rooms_) {
    ids.push_back(entry.first.ToString());
  }
  return ids;
}

std::size_t RoomRegistry::RoomCount() const {
  auto lock = LockTable();
  return rooms_.size();
}

void RoomRegistry::Clear() {
  auto lock = LockTable();
  auto count = rooms_.size();
  rooms_.clear();
  observability_->Event(LogLevel::kInfo, "room_registry.cleared", {{"removedRooms", count}});
}

bool RoomRegistry::AddPlayer(const RoomId& room_id, const PlayerId& player_id) {
  auto lock = LockTable();
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return false;
  }
  it->second->AddPlayer(player_id);
  return true;
}

bool RoomRegistry::RemovePlayer(const RoomId& room_id, const PlayerId& player_id) {
  auto lock = LockTable();
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return false;
  }
  it->second->RemovePlayer(player_id);
  return true;
}

bool RoomRegistry::CancelRoomDeletion(const RoomId& room_id) {
  auto lock = LockTable();
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return false;
  }
  it->second->CancelDeletion();
  return true;
}

bool RoomRegistry::TouchRoom(const RoomId& room_id) {
  auto lock = LockTable();
  auto it = rooms_.find(room_id);
  if (it == rooms_.end()) {
    return false;
  }
  it->second->ScheduleDeletion();
  return true;
}

}  // namespace wormhole
