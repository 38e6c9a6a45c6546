/*
 * 설명: 구조화 로그(JSON 한 줄)와 방 수명주기/요청 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wormhole {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// 알 수 없는 문자열은 info로 취급한다.
LogLevel ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> room_id;
  std::string name;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t rooms_created{0};
  std::uint64_t rooms_deleted{0};
  std::uint64_t deletion_requests{0};
  std::uint64_t active_rooms{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cout);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementRoomsCreated();
  void IncrementRoomsDeleted();
  void IncrementDeletionRequests();
  MetricsSnapshot Snapshot(std::uint64_t active_rooms) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, std::string_view name, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  void Write(const nlohmann::json& line) const;

  LogLevel min_level_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> rooms_created_{0};
  std::atomic<std::uint64_t> rooms_deleted_{0};
  std::atomic<std::uint64_t> deletion_requests_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace wormhole
