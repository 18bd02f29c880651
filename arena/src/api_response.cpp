/*
 * 설명: JSON 응답 엔벨로프와 도메인 페이로드를 생성한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/api_response_test.cpp
 */
#include "arena/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arena {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto itt = clock::to_time_t(clock::now());
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
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

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToJson(const MatchProposal& proposal) {
  return nlohmann::json{{"paperPosition", proposal.paper_position},
                        {"paperId", proposal.paper_id},
                        {"title", proposal.title},
                        {"pdfPath", proposal.pdf_path},
                        {"reviewerA", proposal.reviewer_a},
                        {"reviewerB", proposal.reviewer_b},
                        {"reviewA", proposal.review_a},
                        {"reviewB", proposal.review_b}};
}

nlohmann::json ToJson(const LeaderboardEntry& entry) {
  return nlohmann::json{{"rank", entry.rank},
                        {"reviewer", entry.reviewer},
                        {"rating", entry.stats.rating},
                        {"ci95", nlohmann::json::array({entry.stats.ci_low, entry.stats.ci_high})},
                        {"votes", entry.stats.vote_mass}};
}

nlohmann::json LeaderboardToJson(const std::vector<LeaderboardEntry>& entries, double total_vote_mass) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& entry : entries) {
    items.push_back(ToJson(entry));
  }
  return nlohmann::json{{"total", entries.size()}, {"totalVotes", total_vote_mass}, {"entries", items}};
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  return nlohmann::json{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"votes", {{"applied", snapshot.votes_applied}}},
                        {"matching", {{"selected", snapshot.pairs_selected}, {"notFound", snapshot.pairs_not_found}}},
                        {"reviewers", snapshot.reviewers}};
}

}  // namespace arena
