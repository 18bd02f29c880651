#include <gtest/gtest.h>

#include "arena/rating_engine.hpp"
#include "vote_fixtures.hpp"

namespace {

using arena_test::UniformVote;

TEST(RatingStatsTest, ZeroVoteMassCollapsesInterval) {
  arena::RatingEngine engine;
  auto ci = engine.ConfidenceInterval(1480.0, 0.0);
  EXPECT_DOUBLE_EQ(ci.first, 1480.0);
  EXPECT_DOUBLE_EQ(ci.second, 1480.0);
}

TEST(RatingStatsTest, IntervalShrinksWithVoteMass) {
  arena::RatingEngine engine;
  auto one = engine.ConfidenceInterval(1500.0, 1.0);
  EXPECT_NEAR(one.first, 1500.0 - 1.96 * 32.0, 1e-9);
  EXPECT_NEAR(one.second, 1500.0 + 1.96 * 32.0, 1e-9);

  auto four = engine.ConfidenceInterval(1500.0, 4.0);
  EXPECT_NEAR(four.first, 1468.64, 1e-9);
  EXPECT_NEAR(four.second, 1531.36, 1e-9);
  EXPECT_LT(four.second - four.first, one.second - one.first);
}

TEST(RatingStatsTest, StatsReportVoteMassPerReviewer) {
  arena::RatingEngine engine;
  engine.Update(UniformVote("alpha", "beta", arena::Judgement::kABetter));
  engine.Rating("lurker");

  auto stats = engine.Stats();
  ASSERT_EQ(stats.size(), 3u);

  const auto& alpha = stats.at("alpha");
  EXPECT_DOUBLE_EQ(alpha.rating, 1516.0);
  EXPECT_DOUBLE_EQ(alpha.vote_mass, 1.0);
  EXPECT_NEAR(alpha.ci_low, 1516.0 - 62.72, 1e-9);
  EXPECT_NEAR(alpha.ci_high, 1516.0 + 62.72, 1e-9);

  // 전패한 쪽은 투표량이 0이라 구간이 한 점으로 모인다.
  const auto& beta = stats.at("beta");
  EXPECT_DOUBLE_EQ(beta.vote_mass, 0.0);
  EXPECT_DOUBLE_EQ(beta.ci_low, beta.rating);
  EXPECT_DOUBLE_EQ(beta.ci_high, beta.rating);

  const auto& lurker = stats.at("lurker");
  EXPECT_DOUBLE_EQ(lurker.rating, 1500.0);
  EXPECT_DOUBLE_EQ(lurker.ci_low, 1500.0);
}

TEST(RatingStatsTest, TieSplitsVoteMassEvenly) {
  arena::RatingEngine engine;
  engine.Update(UniformVote("alpha", "beta", arena::Judgement::kTie));
  engine.Update(UniformVote("beta", "alpha", arena::Judgement::kBothBad));
  auto stats = engine.Stats();
  EXPECT_DOUBLE_EQ(stats.at("alpha").vote_mass, 1.0);
  EXPECT_DOUBLE_EQ(stats.at("beta").vote_mass, 1.0);
}

}  // namespace
