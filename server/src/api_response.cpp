/*
 * 설명: JSON 응답 엔벨로프와 방 스냅샷 표현을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "wormhole/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace wormhole {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToJson(const RoomSnapshot& snapshot) {
  nlohmann::json players = nlohmann::json::array();
  for (const auto& player : snapshot.players) {
    players.push_back(player.ToString());
  }
  return {{"roomId", snapshot.id.ToString()},
          {"players", players},
          {"deletionState", ToString(snapshot.deletion_state)}};
}

}  // namespace wormhole
