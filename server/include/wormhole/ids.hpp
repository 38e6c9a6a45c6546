/*
 * 설명: 방/플레이어를 식별하는 128비트 값 타입과 UUID 텍스트 표현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ids_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace wormhole {

// 상위/하위 64비트로 나눈 128비트 식별자. 바이트 순서는 UUID와 같은 big-endian이다.
template <typename Tag>
class Id128 {
 public:
  Id128() = default;
  explicit Id128(std::uint64_t low) : low_(low) {}
  Id128(std::uint64_t high, std::uint64_t low) : high_(high), low_(low) {}
  Id128(const boost::uuids::uuid& uuid) {
    for (std::size_t i = 0; i < 8; ++i) {
      high_ = (high_ << 8) | uuid.data[i];
      low_ = (low_ << 8) | uuid.data[i + 8];
    }
  }

  static std::optional<Id128> Parse(const std::string& text) {
    try {
      return Id128(boost::uuids::string_generator()(text));
    } catch (const std::runtime_error&) {
      return std::nullopt;
    }
  }

  std::uint64_t High() const { return high_; }
  std::uint64_t Low() const { return low_; }

  boost::uuids::uuid ToUuid() const {
    boost::uuids::uuid uuid{};
    for (std::size_t i = 0; i < 8; ++i) {
      uuid.data[7 - i] = static_cast<std::uint8_t>(high_ >> (8 * i));
      uuid.data[15 - i] = static_cast<std::uint8_t>(low_ >> (8 * i));
    }
    return uuid;
  }

  std::string ToString() const { return boost::uuids::to_string(ToUuid()); }

  friend bool operator==(const Id128& lhs, const Id128& rhs) {
    return lhs.high_ == rhs.high_ && lhs.low_ == rhs.low_;
  }
  friend bool operator!=(const Id128& lhs, const Id128& rhs) { return !(lhs == rhs); }
  friend bool operator<(const Id128& lhs, const Id128& rhs) {
    return lhs.high_ != rhs.high_ ? lhs.high_ < rhs.high_ : lhs.low_ < rhs.low_;
  }

 private:
  std::uint64_t high_{0};
  std::uint64_t low_{0};
};

struct RoomIdTag {};
struct PlayerIdTag {};

using RoomId = Id128<RoomIdTag>;
using PlayerId = Id128<PlayerIdTag>;

}  // namespace wormhole

namespace std {

template <typename Tag>
struct hash<wormhole::Id128<Tag>> {
  std::size_t operator()(const wormhole::Id128<Tag>& id) const {
    std::size_t seed = std::hash<std::uint64_t>{}(id.High());
    seed ^= std::hash<std::uint64_t>{}(id.Low()) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
  }
};

}  // namespace std
