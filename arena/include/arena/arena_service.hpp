/*
 * 설명: 투표 로그 재생, 논문별 공정 매칭 선택, 투표 반영, 리더보드 조회를 묶는 아레나 서비스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/arena_service_test.cpp, arena/tests/e2e/arena_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "arena/observability.hpp"
#include "arena/paper_registry.hpp"
#include "arena/random_source.hpp"
#include "arena/rating_engine.hpp"
#include "arena/vote_log.hpp"

namespace arena {

// 논문 id별로 이미 투표한 리뷰어 쌍.
using ExclusionsByPaper = std::unordered_map<std::string, PairExclusions>;

struct MatchProposal {
  std::size_t paper_position{0};
  std::string paper_id;
  std::string title;
  std::string pdf_path;
  std::string reviewer_a;
  std::string reviewer_b;
  std::string review_a;
  std::string review_b;
};

struct LeaderboardEntry {
  std::size_t rank{0};
  std::string reviewer;
  RatingStats stats;
};

class ArenaService {
 public:
  ArenaService(std::shared_ptr<VoteLog> vote_log, std::shared_ptr<PaperRegistry> papers,
               std::shared_ptr<RatingEngine> engine, std::shared_ptr<RandomSource> random,
               std::shared_ptr<Observability> observability);

  // 투표 로그 전체를 엔진에 재생하고 재생한 투표 수를 반환한다.
  std::size_t Bootstrap();

  // start_position부터 순환하며 한 바퀴 안에서 공정 페어가 있는 첫 논문을 고른다.
  std::optional<MatchProposal> SelectMatch(std::size_t start_position, const ExclusionsByPaper& exclusions = {});
  std::optional<MatchProposal> SelectRandomMatch(const ExclusionsByPaper& exclusions = {});

  // 로그에 먼저 기록한 뒤 엔진에 반영한다. 두 단계는 하나의 잠금 안에서 수행된다.
  UpdateResult SubmitVote(const Vote& vote);

  std::vector<LeaderboardEntry> Leaderboard() const;
  double TotalVoteMass() const;

  std::shared_ptr<RatingEngine> GetEngine() { return engine_; }
  std::shared_ptr<PaperRegistry> GetPaperRegistry() { return papers_; }

 private:
  std::string SampleReview(const Paper& paper, const std::string& reviewer_id);

  std::shared_ptr<VoteLog> vote_log_;
  std::shared_ptr<PaperRegistry> papers_;
  std::shared_ptr<RatingEngine> engine_;
  std::shared_ptr<RandomSource> random_;
  std::shared_ptr<Observability> observability_;
  std::mutex vote_mutex_;
};

}  // namespace arena
