/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "wormhole/observability.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace wormhole {

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream& out) : min_level_(min_level), out_(out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementRoomsCreated() { rooms_created_.fetch_add(1); }

void Observability::IncrementRoomsDeleted() { rooms_deleted_.fetch_add(1); }

void Observability::IncrementDeletionRequests() { deletion_requests_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_rooms) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.rooms_created = rooms_created_.load();
  snapshot.rooms_deleted = rooms_deleted_.load();
  snapshot.deletion_requests = deletion_requests_.load();
  snapshot.active_rooms = active_rooms;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(LogLevel::kInfo)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(LogLevel::kInfo);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.room_id) {
    log_json["roomId"] = *ctx.room_id;
  }
  Write(log_json);
}

void Observability::Event(LogLevel level, std::string_view name, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(level);
  log_json["eventName"] = name;
  if (fields.is_object()) {
    for (auto it = fields.begin(); it != fields.end(); ++it) {
      log_json[it.key()] = it.value();
    }
  }
  Write(log_json);
}

void Observability::Write(const nlohmann::json& line) const {
  auto text = line.dump();
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << text << std::endl;
}

}  // namespace wormhole
