/*
 * 설명: REST 응답 엔벨로프와 매칭/리더보드/메트릭 페이로드 직렬화를 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/api_response_test.cpp
 */
#pragma once

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "arena/arena_service.hpp"
#include "arena/observability.hpp"

namespace arena {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

nlohmann::json ToJson(const MatchProposal& proposal);
nlohmann::json ToJson(const LeaderboardEntry& entry);
nlohmann::json LeaderboardToJson(const std::vector<LeaderboardEntry>& entries, double total_vote_mass);
nlohmann::json ToJson(const MetricsSnapshot& snapshot);

}  // namespace arena
