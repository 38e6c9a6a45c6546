/*
 * 설명: HTTP 연결을 처리하고 방 생성/조회/목록 및 상태 확인 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/rooms_api_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "wormhole/api_response.hpp"
#include "wormhole/observability.hpp"
#include "wormhole/room_deletion_channel.hpp"
#include "wormhole/room_registry.hpp"

namespace wormhole {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<RoomRegistry> registry,
              RoomDeletionSender deletion_sender, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  // rest는 /api/v1/rooms 뒤에 남은 경로로, 비어 있거나 "/{id}" 형태다.
  void HandleRoomsRequest(const std::string& rest, const std::shared_ptr<Response>& res);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<RoomRegistry> registry_;
  RoomDeletionSender deletion_sender_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> room_id_;
};

}  // namespace wormhole
