/*
 * 설명: 재생/매칭/투표 반영/리더보드를 구현한다. 매칭 실패 시 다음 논문으로 넘어가는 정책을 가진다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/arena_service_test.cpp, arena/tests/e2e/arena_api_test.cpp
 */
#include "arena/arena_service.hpp"

#include <algorithm>
#include <utility>

#include "arena/errors.hpp"

namespace arena {

ArenaService::ArenaService(std::shared_ptr<VoteLog> vote_log, std::shared_ptr<PaperRegistry> papers,
                           std::shared_ptr<RatingEngine> engine, std::shared_ptr<RandomSource> random,
                           std::shared_ptr<Observability> observability)
    : vote_log_(std::move(vote_log)), papers_(std::move(papers)), engine_(std::move(engine)),
      random_(std::move(random)), observability_(std::move(observability)) {
  if (!random_) {
    random_ = std::make_shared<MtRandomSource>();
  }
  if (!observability_) {
    observability_ = std::make_shared<Observability>();
  }
}

std::size_t ArenaService::Bootstrap() {
  std::lock_guard<std::mutex> lock(vote_mutex_);
  auto votes = vote_log_->GetAllVotes();
  engine_->Replay(votes);
  observability_->Log(LogLevel::kInfo, "ratings_replayed",
                      {{"votes", votes.size()}, {"reviewers", engine_->ReviewerCount()}});
  return votes.size();
}

std::optional<MatchProposal> ArenaService::SelectMatch(std::size_t start_position,
                                                       const ExclusionsByPaper& exclusions) {
  const std::size_t paper_count = papers_->Count();
  if (paper_count == 0) {
    throw PreconditionViolation("empty_registry", "논문 목록이 비어 있습니다");
  }
  static const PairExclusions kNoExclusions;

  for (std::size_t attempt = 0; attempt < paper_count; ++attempt) {
    std::size_t position = (start_position + attempt) % paper_count;
    const Paper& paper = papers_->At(position);
    auto pool = paper.ValidReviewerIds();
    auto excl_it = exclusions.find(paper.paper_id);
    const PairExclusions& exclude = excl_it == exclusions.end() ? kNoExclusions : excl_it->second;

    std::optional<ReviewerPair> pair;
    if (pool.size() >= 2) {
      pair = engine_->FindFairPair(pool, pool, exclude);
    }
    if (!pair) {
      observability_->IncrementPairsNotFound();
      observability_->Log(LogLevel::kWarn, "fair_pair_not_found",
                          {{"paperId", paper.paper_id}, {"position", position}, {"candidates", pool.size()}});
      continue;
    }

    MatchProposal proposal;
    proposal.paper_position = position;
    proposal.paper_id = paper.paper_id;
    proposal.title = paper.title;
    proposal.pdf_path = paper.pdf_path;
    proposal.reviewer_a = pair->reviewer_a;
    proposal.reviewer_b = pair->reviewer_b;
    proposal.review_a = SampleReview(paper, pair->reviewer_a);
    proposal.review_b = SampleReview(paper, pair->reviewer_b);
    observability_->IncrementPairsSelected();
    observability_->Log(LogLevel::kInfo, "fair_pair_selected",
                        {{"paperId", paper.paper_id},
                         {"position", position},
                         {"reviewerA", proposal.reviewer_a},
                         {"reviewerB", proposal.reviewer_b}});
    return proposal;
  }

  observability_->Log(LogLevel::kError, "match_not_found", {{"attempts", paper_count}});
  return std::nullopt;
}

std::optional<MatchProposal> ArenaService::SelectRandomMatch(const ExclusionsByPaper& exclusions) {
  return SelectMatch(papers_->SamplePosition(*random_), exclusions);
}

std::string ArenaService::SampleReview(const Paper& paper, const std::string& reviewer_id) {
  auto reviews = paper.NonBlankReviews(reviewer_id);
  if (reviews.empty()) {
    return {};
  }
  return reviews[random_->UniformIndex(reviews.size())];
}

UpdateResult ArenaService::SubmitVote(const Vote& vote) {
  ValidateVote(vote);
  std::lock_guard<std::mutex> lock(vote_mutex_);
  vote_log_->StoreVote(vote);
  UpdateResult result = engine_->Update(vote);
  observability_->IncrementVotesApplied();
  observability_->Log(LogLevel::kInfo, "vote_applied",
                      {{"sessionId", vote.session_id},
                       {"paperId", vote.paper_id},
                       {"reviewerA", vote.reviewer_a},
                       {"reviewerB", vote.reviewer_b},
                       {"normalizedScore", result.normalized_score},
                       {"ratingA", result.rating_a},
                       {"ratingB", result.rating_b}});
  return result;
}

std::vector<LeaderboardEntry> ArenaService::Leaderboard() const {
  auto stats = engine_->Stats();
  std::vector<LeaderboardEntry> entries;
  entries.reserve(stats.size());
  for (const auto& entry : stats) {
    entries.push_back(LeaderboardEntry{0, entry.first, entry.second});
  }
  std::sort(entries.begin(), entries.end(), [](const LeaderboardEntry& lhs, const LeaderboardEntry& rhs) {
    if (lhs.stats.rating == rhs.stats.rating) {
      return lhs.reviewer < rhs.reviewer;
    }
    return lhs.stats.rating > rhs.stats.rating;
  });
  for (std::size_t i = 0; i < entries.size(); ++i) {
    entries[i].rank = i + 1;
  }
  return entries;
}

double ArenaService::TotalVoteMass() const {
  double total = 0.0;
  for (const auto& entry : engine_->Stats()) {
    total += entry.second.vote_mass;
  }
  return total;
}

}  // namespace arena
