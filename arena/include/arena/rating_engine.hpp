/*
 * 설명: 4개 평가 항목 가중 Elo 갱신, 공정 페어 탐색, 리더보드 통계를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_update_test.cpp, arena/tests/unit/fair_pair_test.cpp,
 *         arena/tests/unit/rating_stats_test.cpp, arena/tests/unit/replay_determinism_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "arena/category_weights.hpp"
#include "arena/random_source.hpp"
#include "arena/rating_store.hpp"
#include "arena/vote.hpp"

namespace arena {

struct EloSettings {
  CategoryWeights weights{};
  double k_factor{32.0};
  double initial_rating{1500.0};
  double fair_match_step{10.0};
  std::size_t max_attempts{100};
};

// 순서 있는 쌍으로 저장하지만 제외 판정은 양방향으로 한다.
using PairExclusions = std::set<std::pair<std::string, std::string>>;

struct ReviewerPair {
  std::string reviewer_a;
  std::string reviewer_b;
};

struct RatingStats {
  double rating{0.0};
  double ci_low{0.0};
  double ci_high{0.0};
  double vote_mass{0.0};
};

struct UpdateResult {
  double normalized_score{0.0};
  double rating_a{0.0};
  double rating_b{0.0};
};

class RatingEngine {
 public:
  // 가중치가 잘못되면 ConfigurationError. random이 비어 있으면 MtRandomSource를 쓴다.
  explicit RatingEngine(EloSettings settings = EloSettings{}, std::shared_ptr<RandomSource> random = nullptr);

  // 기존 상태를 비우고 이력을 주어진 순서대로 다시 적용한다.
  void Replay(const std::vector<Vote>& history);
  UpdateResult Update(const Vote& vote);

  std::optional<ReviewerPair> FindFairPair(const std::set<std::string>& pool_a, const std::set<std::string>& pool_b,
                                           const PairExclusions& exclude_pairs, double step);
  std::optional<ReviewerPair> FindFairPair(const std::set<std::string>& pool_a, const std::set<std::string>& pool_b,
                                           const PairExclusions& exclude_pairs = {});

  std::map<std::string, RatingStats> Stats() const;
  double Rating(const std::string& id);
  // 조회만 한다. 처음 보는 리뷰어는 등록하지 않고 nullopt.
  std::optional<double> FindRating(const std::string& id) const;
  std::map<std::string, double> Ratings() const;
  std::size_t ReviewerCount() const;

  double NormalizedScore(const Vote& vote) const;
  // 95% 신뢰구간 근사치. 투표량이 0이면 (rating, rating).
  std::pair<double, double> ConfidenceInterval(double rating, double vote_mass) const;
  static double ExpectedScore(double rating_a, double rating_b);

  const EloSettings& Settings() const { return settings_; }

 private:
  UpdateResult ApplyUpdate(const Vote& vote);
  std::optional<ReviewerPair> PickColdStartPair(const std::vector<std::string>& candidates_a,
                                                const std::set<std::string>& pool_b,
                                                const PairExclusions& exclude_pairs);

  EloSettings settings_;
  std::shared_ptr<RandomSource> random_;
  RatingStore store_;
  mutable std::mutex mutex_;
};

}  // namespace arena
