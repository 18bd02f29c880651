/*
 * 설명: 비교 투표 레코드와 판정 열거형, 투표 로그 JSON 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/vote_codec_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "arena/category_weights.hpp"

namespace arena {

enum class Judgement { kABetter, kBBetter, kTie, kBothBad };

// 투표 로그에 저장되는 판정 문자열. 이 네 값 외에는 계약 위반이다.
extern const char* const kJudgementLabels[4];

Judgement ParseJudgement(std::string_view label);
const char* JudgementLabel(Judgement judgement);
// A 관점 점수. 양쪽 모두 나쁨은 무승부와 동일하게 0.5로 본다.
double JudgementScore(Judgement judgement);

struct Vote {
  std::string session_id;
  std::string paper_id;
  std::string reviewer_a;
  std::string reviewer_b;
  Judgement technical_quality{Judgement::kTie};
  Judgement constructiveness{Judgement::kTie};
  Judgement clarity{Judgement::kTie};
  Judgement overall_quality{Judgement::kTie};
  std::string review_a;
  std::string review_b;
  std::chrono::system_clock::time_point vote_time{};

  Judgement Get(Category category) const;
};

// 자기 자신과의 비교, 빈 식별자를 PreconditionViolation으로 거부한다.
void ValidateVote(const Vote& vote);

nlohmann::json VoteToJson(const Vote& vote);
Vote VoteFromJson(const nlohmann::json& json);

std::string FormatVoteTime(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point ParseVoteTime(const std::string& text);

}  // namespace arena
