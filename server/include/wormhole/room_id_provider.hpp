/*
 * 설명: 새 방에 사용할 후보 식별자를 공급하는 인터페이스와 기본 난수 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#pragma once

#include <boost/uuid/random_generator.hpp>

#include "wormhole/ids.hpp"

namespace wormhole {

// 레지스트리 내용을 알지 못한다. 충돌 검사는 RoomRegistry 책임이다.
class RoomIdProvider {
 public:
  virtual ~RoomIdProvider() = default;
  virtual RoomId ProvideId() = 0;
};

// 균등 분포 v4 UUID를 뽑는다.
class RandomRoomIdProvider : public RoomIdProvider {
 public:
  RoomId ProvideId() override;

 private:
  boost::uuids::random_generator generator_;
};

}  // namespace wormhole
