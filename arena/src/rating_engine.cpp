/*
 * 설명: 가중 Elo 갱신, 창 확장 방식의 공정 페어 탐색, 신뢰구간 통계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_update_test.cpp, arena/tests/unit/fair_pair_test.cpp,
 *         arena/tests/unit/rating_stats_test.cpp, arena/tests/unit/replay_determinism_test.cpp
 */
#include "arena/rating_engine.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "arena/errors.hpp"

namespace arena {
namespace {
constexpr double kCi95 = 1.96;

bool IsExcluded(const PairExclusions& exclude_pairs, const std::string& a, const std::string& b) {
  return exclude_pairs.count({a, b}) > 0 || exclude_pairs.count({b, a}) > 0;
}
}  // namespace

RatingEngine::RatingEngine(EloSettings settings, std::shared_ptr<RandomSource> random)
    : settings_(settings), random_(std::move(random)), store_(settings.initial_rating) {
  ValidateWeights(settings_.weights);
  if (!std::isfinite(settings_.k_factor) || settings_.k_factor <= 0.0) {
    throw ConfigurationError("invalid_config", "k_factor는 양수여야 합니다");
  }
  if (!std::isfinite(settings_.initial_rating)) {
    throw ConfigurationError("invalid_config", "initial_rating이 유한한 값이 아닙니다");
  }
  if (!std::isfinite(settings_.fair_match_step) || settings_.fair_match_step <= 0.0) {
    throw ConfigurationError("invalid_config", "fair_match_step은 양수여야 합니다");
  }
  if (settings_.max_attempts == 0) {
    throw ConfigurationError("invalid_config", "max_attempts는 1 이상이어야 합니다");
  }
  if (!random_) {
    random_ = std::make_shared<MtRandomSource>();
  }
}

void RatingEngine::Replay(const std::vector<Vote>& history) {
  std::lock_guard<std::mutex> lock(mutex_);
  store_.Clear();
  for (const auto& vote : history) {
    ApplyUpdate(vote);
  }
}

UpdateResult RatingEngine::Update(const Vote& vote) {
  std::lock_guard<std::mutex> lock(mutex_);
  return ApplyUpdate(vote);
}

UpdateResult RatingEngine::ApplyUpdate(const Vote& vote) {
  ValidateVote(vote);
  double normalized_score = NormalizedScore(vote);

  double& rating_a = store_.RatingOf(vote.reviewer_a);
  double& rating_b = store_.RatingOf(vote.reviewer_b);
  double expected_a = ExpectedScore(rating_a, rating_b);
  double expected_b = 1.0 - expected_a;

  rating_a += settings_.k_factor * (normalized_score - expected_a);
  rating_b += settings_.k_factor * ((1.0 - normalized_score) - expected_b);

  store_.AddVoteMass(vote.reviewer_a, normalized_score);
  store_.AddVoteMass(vote.reviewer_b, 1.0 - normalized_score);
  return UpdateResult{normalized_score, rating_a, rating_b};
}

double RatingEngine::NormalizedScore(const Vote& vote) const {
  double total_score = 0.0;
  for (Category category : kAllCategories) {
    total_score += settings_.weights.Get(category) * JudgementScore(vote.Get(category));
  }
  // 합이 1로 검증되어 있어도 실제 합으로 나눈다.
  return total_score / settings_.weights.Sum();
}

double RatingEngine::ExpectedScore(double rating_a, double rating_b) {
  double exponent = (rating_b - rating_a) / 400.0;
  return 1.0 / (1.0 + std::pow(10.0, exponent));
}

std::optional<ReviewerPair> RatingEngine::FindFairPair(const std::set<std::string>& pool_a,
                                                       const std::set<std::string>& pool_b,
                                                       const PairExclusions& exclude_pairs) {
  return FindFairPair(pool_a, pool_b, exclude_pairs, settings_.fair_match_step);
}

std::optional<ReviewerPair> RatingEngine::FindFairPair(const std::set<std::string>& pool_a,
                                                       const std::set<std::string>& pool_b,
                                                       const PairExclusions& exclude_pairs, double step) {
  if (!std::isfinite(step) || step <= 0.0) {
    std::ostringstream oss;
    oss << "탐색 간격은 양수여야 합니다: " << step;
    throw PreconditionViolation("invalid_step", oss.str());
  }
  if (pool_a.empty() || pool_b.empty()) {
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> candidates_a(pool_a.begin(), pool_a.end());
  if (store_.Empty()) {
    return PickColdStartPair(candidates_a, pool_b, exclude_pairs);
  }

  std::vector<std::pair<const std::string*, double>> opponents;
  std::vector<const std::string*> eligible;
  for (std::size_t attempt = 0; attempt < settings_.max_attempts; ++attempt) {
    const std::string& reviewer_a = candidates_a[random_->UniformIndex(candidates_a.size())];
    double base_rating = store_.RatingOf(reviewer_a);

    opponents.clear();
    for (const auto& reviewer_b : pool_b) {
      if (reviewer_b == reviewer_a) {
        continue;
      }
      double rating_b = store_.RatingOf(reviewer_b);
      if (!IsExcluded(exclude_pairs, reviewer_a, reviewer_b)) {
        opponents.emplace_back(&reviewer_b, rating_b);
      }
    }
    if (opponents.empty()) {
      continue;
    }

    // 가장 가까운 상대가 처음 들어오는 창(step 배수로 올림)을 바로 구한다.
    // 창은 전역 최소/최대까지의 거리를 넘지 않는다.
    double max_possible_diff = std::max(store_.MaxRating() - base_rating, base_rating - store_.MinRating());
    double min_diff = max_possible_diff;
    for (const auto& opponent : opponents) {
      min_diff = std::min(min_diff, std::fabs(opponent.second - base_rating));
    }
    double window = std::max(std::ceil(min_diff / step) * step, min_diff);
    window = std::min(window, max_possible_diff);

    eligible.clear();
    for (const auto& opponent : opponents) {
      if (std::fabs(opponent.second - base_rating) <= window) {
        eligible.push_back(opponent.first);
      }
    }
    const std::string& reviewer_b = *eligible[random_->UniformIndex(eligible.size())];
    return ReviewerPair{reviewer_a, reviewer_b};
  }
  return std::nullopt;
}

std::optional<ReviewerPair> RatingEngine::PickColdStartPair(const std::vector<std::string>& candidates_a,
                                                            const std::set<std::string>& pool_b,
                                                            const PairExclusions& exclude_pairs) {
  // 이력이 없으면 공정성 판단이 무의미하므로 무작위로 고른다.
  const std::string& reviewer_a = candidates_a[random_->UniformIndex(candidates_a.size())];
  std::vector<const std::string*> candidates_b;
  for (const auto& reviewer_b : pool_b) {
    if (reviewer_b != reviewer_a && !IsExcluded(exclude_pairs, reviewer_a, reviewer_b)) {
      candidates_b.push_back(&reviewer_b);
    }
  }
  if (candidates_b.empty()) {
    return std::nullopt;
  }
  return ReviewerPair{reviewer_a, *candidates_b[random_->UniformIndex(candidates_b.size())]};
}

std::pair<double, double> RatingEngine::ConfidenceInterval(double rating, double vote_mass) const {
  if (vote_mass == 0.0) {
    return {rating, rating};
  }
  double std_dev = settings_.k_factor / std::sqrt(vote_mass);
  double margin = kCi95 * std_dev;
  return {rating - margin, rating + margin};
}

std::map<std::string, RatingStats> RatingEngine::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, RatingStats> stats;
  for (const auto& entry : store_.Ratings()) {
    double vote_mass = store_.VoteMassOf(entry.first);
    auto ci = ConfidenceInterval(entry.second, vote_mass);
    stats.emplace(entry.first, RatingStats{entry.second, ci.first, ci.second, vote_mass});
  }
  return stats;
}

double RatingEngine::Rating(const std::string& id) {
  if (id.empty()) {
    throw PreconditionViolation("empty_identity", "리뷰어 식별자가 비어 있습니다");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.RatingOf(id);
}

std::optional<double> RatingEngine::FindRating(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.FindRating(id);
}

std::map<std::string, double> RatingEngine::Ratings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.Ratings();
}

std::size_t RatingEngine::ReviewerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.Size();
}

}  // namespace arena
