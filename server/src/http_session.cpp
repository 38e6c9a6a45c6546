/*
 * 설명: HTTP 요청을 처리하고 방 API 경로로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/rooms_api_test.cpp
 */
#include "wormhole/http_session.hpp"

#include <boost/beast/version.hpp>

namespace wormhole {

namespace {
constexpr const char* kRoomsPath = "/api/v1/rooms";

void SetJsonBody(HttpSession::Response& res, boost::beast::http::status status, const nlohmann::json& envelope) {
  auto body = envelope.dump();
  res.result(status);
  res.body() = body;
  res.content_length(body.size());
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<RoomRegistry> registry,
                         RoomDeletionSender deletion_sender, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), registry_(std::move(registry)), deletion_sender_(std::move(deletion_sender)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  room_id_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "wormhole");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(payload));
    return SendResponse(res);
  }

  try {
    if (req_.method() == http::verb::get && path == "/metrics") {
      auto snapshot = observability_->Snapshot(registry_->RoomCount());
      nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                          {"rooms",
                           {{"active", snapshot.active_rooms},
                            {"created", snapshot.rooms_created},
                            {"deleted", snapshot.rooms_deleted},
                            {"deletionRequests", snapshot.deletion_requests}}}};
      SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(data));
      return SendResponse(res);
    }

    if (path.compare(0, std::char_traits<char>::length(kRoomsPath), kRoomsPath) == 0) {
      std::string rest = path.substr(std::char_traits<char>::length(kRoomsPath));
      // /api/v1/rooms, /api/v1/rooms/, /api/v1/rooms/{id} 만 허용한다.
      if (rest.empty() || (rest[0] == '/' && rest.find('/', 1) == std::string::npos)) {
        HandleRoomsRequest(rest, res);
        return SendResponse(res);
      }
    }
  } catch (const RegistryUnavailableError& ex) {
    SetJsonBody(*res, http::status::service_unavailable, MakeErrorEnvelope("registry_unavailable", ex.what()));
    return SendResponse(res);
  }

  SetJsonBody(*res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  SendResponse(res);
}

void HttpSession::HandleRoomsRequest(const std::string& rest, const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  bool collection = rest.empty() || rest == "/";

  if (collection && req_.method() == http::verb::post) {
    RoomCreationError error;
    auto room_id = registry_->CreateRoom(deletion_sender_, error);
    if (!room_id) {
      SetJsonBody(*res, http::status::internal_server_error, MakeErrorEnvelope("room_id_exhausted", error.Message()));
      return;
    }
    room_id_ = room_id->ToString();
    res->set(http::field::location, "/ws/" + *room_id_);
    SetJsonBody(*res, http::status::created, MakeSuccessEnvelope({{"roomId", *room_id_}}));
    return;
  }

  if (collection && req_.method() == http::verb::get) {
    nlohmann::json data{{"rooms", registry_->ListActiveRooms()}};
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(data));
    return;
  }

  if (!collection && req_.method() == http::verb::get) {
    auto room_id = RoomId::Parse(rest.substr(1));
    auto snapshot = room_id ? registry_->GetRoomForId(*room_id) : std::nullopt;
    if (!snapshot) {
      SetJsonBody(*res, http::status::not_found, MakeErrorEnvelope("room_not_found", "방을 찾을 수 없습니다"));
      return;
    }
    room_id_ = snapshot->id.ToString();
    SetJsonBody(*res, http::status::ok, MakeSuccessEnvelope(ToJson(*snapshot)));
    return;
  }

  SetJsonBody(*res, http::status::method_not_allowed,
              MakeErrorEnvelope("method_not_allowed", "허용되지 않는 메서드입니다"));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, room_id_, std::string(req_.target()), latency});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace wormhole
