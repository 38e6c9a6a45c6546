/*
 * 설명: boost::uuids 난수 생성기로 방 식별자를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#include "wormhole/room_id_provider.hpp"

namespace wormhole {

RoomId RandomRoomIdProvider::ProvideId() { return RoomId(generator_()); }

}  // namespace wormhole
