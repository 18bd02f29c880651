/*
 * 설명: 구조화 로그 출력과 메트릭 카운터를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/observability_test.cpp
 */
#include "arena/observability.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>

#include "arena/errors.hpp"

namespace arena {

LogLevel ParseLogLevel(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw ConfigurationError("invalid_config", "알 수 없는 로그 레벨입니다: " + text);
}

const char* LogLevelName(LogLevel level) {
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

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementVotesApplied() { votes_applied_.fetch_add(1); }

void Observability::IncrementPairsSelected() { pairs_selected_.fetch_add(1); }

void Observability::IncrementPairsNotFound() { pairs_not_found_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t reviewers) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.votes_applied = votes_applied_.load();
  snapshot.pairs_selected = pairs_selected_.load();
  snapshot.pairs_not_found = pairs_not_found_.load();
  snapshot.reviewers = reviewers;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json = ctx.fields.is_object() ? ctx.fields : nlohmann::json::object();
  log_json["level"] = LogLevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.latency_ms > 0) {
    log_json["latencyMs"] = ctx.latency_ms;
  }
  std::string line = log_json.dump();
  std::lock_guard<std::mutex> lock(sink_mutex_);
  *sink_ << line << std::endl;
}

void Observability::Log(LogLevel level, const std::string& name, nlohmann::json fields) const {
  LogContext ctx;
  ctx.name = name;
  ctx.level = level;
  ctx.fields = std::move(fields);
  Log(ctx);
}

}  // namespace arena
