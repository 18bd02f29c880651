/*
 * 설명: 레벨 필터가 있는 JSON 한 줄 구조화 로그와 투표/매칭 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/observability_test.cpp, arena/tests/e2e/arena_api_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace arena {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

// debug/info/warn/error 이외 값은 ConfigurationError.
LogLevel ParseLogLevel(const std::string& text);
const char* LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  long latency_ms{0};
  nlohmann::json fields = nlohmann::json::object();
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t votes_applied{0};
  std::uint64_t pairs_selected{0};
  std::uint64_t pairs_not_found{0};
  std::uint64_t reviewers{0};
};

class Observability {
 public:
  // sink가 nullptr이면 std::cout에 기록한다.
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementVotesApplied();
  void IncrementPairsSelected();
  void IncrementPairsNotFound();
  MetricsSnapshot Snapshot(std::uint64_t reviewers) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, const std::string& name, nlohmann::json fields = nlohmann::json::object()) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> votes_applied_{0};
  std::atomic<std::uint64_t> pairs_selected_{0};
  std::atomic<std::uint64_t> pairs_not_found_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace arena
