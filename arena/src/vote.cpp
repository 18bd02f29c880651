/*
 * 설명: 판정 문자열 파싱과 투표 레코드의 JSON/시각 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/vote_codec_test.cpp
 */
#include "arena/vote.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "arena/errors.hpp"

namespace arena {

const char* const kJudgementLabels[4] = {"👈  A is better", "👉  B is better", "🤝  Tie", "👎  Both are bad"};

namespace {
std::string RequireString(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_string()) {
    throw PreconditionViolation("invalid_vote", std::string("투표 필드가 없거나 문자열이 아닙니다: ") + key);
  }
  return it->get<std::string>();
}

std::string OptionalString(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw PreconditionViolation("invalid_vote", std::string("투표 필드가 문자열이 아닙니다: ") + key);
  }
  return it->get<std::string>();
}
}  // namespace

Judgement ParseJudgement(std::string_view label) {
  for (int i = 0; i < 4; ++i) {
    if (label == kJudgementLabels[i]) {
      return static_cast<Judgement>(i);
    }
  }
  throw PreconditionViolation("invalid_judgement", "허용되지 않은 판정 값입니다: " + std::string(label));
}

const char* JudgementLabel(Judgement judgement) { return kJudgementLabels[static_cast<int>(judgement)]; }

double JudgementScore(Judgement judgement) {
  switch (judgement) {
    case Judgement::kABetter:
      return 1.0;
    case Judgement::kBBetter:
      return 0.0;
    case Judgement::kTie:
    case Judgement::kBothBad:
      return 0.5;
  }
  return 0.5;
}

Judgement Vote::Get(Category category) const {
  switch (category) {
    case Category::kTechnicalQuality:
      return technical_quality;
    case Category::kConstructiveness:
      return constructiveness;
    case Category::kClarity:
      return clarity;
    case Category::kOverallQuality:
      return overall_quality;
  }
  return Judgement::kTie;
}

void ValidateVote(const Vote& vote) {
  if (vote.reviewer_a.empty() || vote.reviewer_b.empty()) {
    throw PreconditionViolation("empty_identity", "리뷰어 식별자가 비어 있습니다");
  }
  if (vote.reviewer_a == vote.reviewer_b) {
    throw PreconditionViolation("self_comparison", "같은 리뷰어끼리는 비교할 수 없습니다: " + vote.reviewer_a);
  }
}

nlohmann::json VoteToJson(const Vote& vote) {
  nlohmann::json j;
  j["session_id"] = vote.session_id;
  j["paper_id"] = vote.paper_id;
  j["reviewer_a"] = vote.reviewer_a;
  j["reviewer_b"] = vote.reviewer_b;
  for (Category category : kAllCategories) {
    j[CategoryName(category)] = JudgementLabel(vote.Get(category));
  }
  j["review_a"] = vote.review_a;
  j["review_b"] = vote.review_b;
  j["vote_time"] = FormatVoteTime(vote.vote_time);
  return j;
}

Vote VoteFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw PreconditionViolation("invalid_vote", "투표 레코드는 JSON 객체여야 합니다");
  }
  Vote vote;
  vote.session_id = OptionalString(json, "session_id");
  vote.paper_id = OptionalString(json, "paper_id");
  vote.reviewer_a = RequireString(json, "reviewer_a");
  vote.reviewer_b = RequireString(json, "reviewer_b");
  vote.technical_quality = ParseJudgement(RequireString(json, "technical_quality"));
  vote.constructiveness = ParseJudgement(RequireString(json, "constructiveness"));
  vote.clarity = ParseJudgement(RequireString(json, "clarity"));
  vote.overall_quality = ParseJudgement(RequireString(json, "overall_quality"));
  vote.review_a = OptionalString(json, "review_a");
  vote.review_b = OptionalString(json, "review_b");
  std::string time_text = OptionalString(json, "vote_time");
  vote.vote_time = time_text.empty() ? std::chrono::system_clock::now() : ParseVoteTime(time_text);
  return vote;
}

std::string FormatVoteTime(const std::chrono::system_clock::time_point& tp) {
  auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  if (secs > tp) {
    secs -= std::chrono::seconds(1);
  }
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
  std::time_t tt = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (micros != 0) {
    oss << '.' << std::setw(6) << std::setfill('0') << micros;
  }
  return oss.str();
}

std::chrono::system_clock::time_point ParseVoteTime(const std::string& text) {
  // 로그에 따라 날짜/시각 구분자가 'T' 또는 공백이다.
  const char* format = (text.size() > 10 && text[10] == ' ') ? "%Y-%m-%d %H:%M:%S" : "%Y-%m-%dT%H:%M:%S";
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, format);
  if (iss.fail()) {
    throw PreconditionViolation("invalid_vote", "투표 시각 형식이 올바르지 않습니다: " + text);
  }
  tm.tm_isdst = -1;
  auto tp = std::chrono::system_clock::from_time_t(std::mktime(&tm));

  long micros = 0;
  if (iss.peek() == '.') {
    iss.get();
    int digits = 0;
    while (std::isdigit(iss.peek()) && digits < 6) {
      micros = micros * 10 + (iss.get() - '0');
      ++digits;
    }
    for (; digits < 6 && digits > 0; ++digits) {
      micros *= 10;
    }
  }
  return tp + std::chrono::microseconds(micros);
}

}  // namespace arena
