#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "arena/arena_service.hpp"
#include "arena/errors.hpp"
#include "vote_fixtures.hpp"

namespace {

using arena_test::UniformVote;

arena::Paper MakePaper(const std::string& id, std::map<std::string, std::vector<std::string>> reviews) {
  arena::Paper paper;
  paper.paper_id = id;
  paper.title = "title of " + id;
  paper.pdf_path = id + ".pdf";
  paper.reviews = std::move(reviews);
  return paper;
}

class ArenaServiceFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    // p-1은 유효한 리뷰어가 하나뿐이라 매칭할 수 없다.
    std::vector<arena::Paper> papers{
        MakePaper("p-1", {{"human_reviewer", {"only one"}}, {"barebones", {"   "}}}),
        MakePaper("p-2", {{"human_reviewer", {"human says"}}, {"liang_etal", {"liang says"}}}),
    };
    papers_ = std::make_shared<arena::PaperRegistry>(std::move(papers));
    log_ = std::make_shared<arena::InMemoryVoteLog>();
    random_ = std::make_shared<arena::MtRandomSource>(11);
    engine_ = std::make_shared<arena::RatingEngine>(arena::EloSettings{}, random_);
    observability_ = std::make_shared<arena::Observability>(arena::LogLevel::kDebug, &sink_);
    service_ = std::make_shared<arena::ArenaService>(log_, papers_, engine_, random_, observability_);
  }

  std::ostringstream sink_;
  std::shared_ptr<arena::PaperRegistry> papers_;
  std::shared_ptr<arena::InMemoryVoteLog> log_;
  std::shared_ptr<arena::MtRandomSource> random_;
  std::shared_ptr<arena::RatingEngine> engine_;
  std::shared_ptr<arena::Observability> observability_;
  std::shared_ptr<arena::ArenaService> service_;
};

TEST_F(ArenaServiceFixture, BootstrapReplaysStoredVotes) {
  log_->StoreVote(UniformVote("human_reviewer", "barebones", arena::Judgement::kABetter));
  log_->StoreVote(UniformVote("liang_etal", "barebones", arena::Judgement::kTie));

  EXPECT_EQ(service_->Bootstrap(), 2u);
  EXPECT_DOUBLE_EQ(engine_->Rating("human_reviewer"), 1516.0);
  EXPECT_EQ(engine_->ReviewerCount(), 3u);
  EXPECT_NE(sink_.str().find("\"eventName\":\"ratings_replayed\""), std::string::npos);
}

TEST_F(ArenaServiceFixture, SubmitVoteStoresThenUpdates) {
  auto result = service_->SubmitVote(UniformVote("human_reviewer", "liang_etal", arena::Judgement::kBBetter));
  EXPECT_DOUBLE_EQ(result.normalized_score, 0.0);
  EXPECT_DOUBLE_EQ(result.rating_a, 1484.0);
  EXPECT_DOUBLE_EQ(result.rating_b, 1516.0);
  ASSERT_EQ(log_->GetAllVotes().size(), 1u);
  EXPECT_EQ(observability_->Snapshot(0).votes_applied, 1u);

  // 재시작과 같은 상황: 로그만으로 같은 상태가 복원된다.
  auto restarted = std::make_shared<arena::RatingEngine>();
  arena::ArenaService replica(log_, papers_, restarted, random_, observability_);
  replica.Bootstrap();
  EXPECT_EQ(restarted->Ratings(), engine_->Ratings());
}

TEST_F(ArenaServiceFixture, RejectedVoteIsNotStored) {
  EXPECT_THROW(service_->SubmitVote(UniformVote("liang_etal", "liang_etal", arena::Judgement::kTie)),
               arena::PreconditionViolation);
  EXPECT_TRUE(log_->GetAllVotes().empty());
  EXPECT_EQ(engine_->ReviewerCount(), 0u);
}

TEST_F(ArenaServiceFixture, SelectMatchSkipsPaperWithoutFairPair) {
  auto proposal = service_->SelectMatch(0);
  ASSERT_TRUE(proposal.has_value());
  EXPECT_EQ(proposal->paper_position, 1u);
  EXPECT_EQ(proposal->paper_id, "p-2");
  EXPECT_EQ(proposal->title, "title of p-2");
  EXPECT_EQ(proposal->pdf_path, "p-2.pdf");
  EXPECT_NE(proposal->reviewer_a, proposal->reviewer_b);
  const std::string& review_a = proposal->reviewer_a == "human_reviewer" ? "human says" : "liang says";
  EXPECT_EQ(proposal->review_a, review_a);

  auto metrics = observability_->Snapshot(0);
  EXPECT_EQ(metrics.pairs_not_found, 1u);
  EXPECT_EQ(metrics.pairs_selected, 1u);
  EXPECT_NE(sink_.str().find("fair_pair_not_found"), std::string::npos);
}

TEST_F(ArenaServiceFixture, ExcludedPairsExhaustAllPapers) {
  arena::ExclusionsByPaper exclusions;
  exclusions["p-2"].emplace("human_reviewer", "liang_etal");
  EXPECT_FALSE(service_->SelectMatch(1, exclusions).has_value());
  EXPECT_NE(sink_.str().find("match_not_found"), std::string::npos);
  EXPECT_EQ(observability_->Snapshot(0).pairs_not_found, 2u);
}

TEST_F(ArenaServiceFixture, RandomMatchAlwaysLandsOnMatchablePaper) {
  for (int i = 0; i < 20; ++i) {
    auto proposal = service_->SelectRandomMatch();
    ASSERT_TRUE(proposal.has_value());
    EXPECT_EQ(proposal->paper_id, "p-2");
  }
}

TEST_F(ArenaServiceFixture, LeaderboardOrdersByRatingThenName) {
  service_->SubmitVote(UniformVote("liang_etal", "barebones", arena::Judgement::kABetter));
  service_->SubmitVote(UniformVote("human_reviewer", "multi_agent_without_knowledge", arena::Judgement::kTie));

  auto board = service_->Leaderboard();
  ASSERT_EQ(board.size(), 4u);
  EXPECT_EQ(board[0].reviewer, "liang_etal");
  EXPECT_EQ(board[0].rank, 1u);
  EXPECT_EQ(board[1].reviewer, "human_reviewer");
  EXPECT_EQ(board[2].reviewer, "multi_agent_without_knowledge");
  EXPECT_EQ(board[3].reviewer, "barebones");
  EXPECT_EQ(board[3].rank, 4u);
  EXPECT_DOUBLE_EQ(service_->TotalVoteMass(), 2.0);
}

TEST(ArenaServiceTest, EmptyRegistryCannotMatch) {
  arena::ArenaService service(std::make_shared<arena::InMemoryVoteLog>(), std::make_shared<arena::PaperRegistry>(),
                              std::make_shared<arena::RatingEngine>(), nullptr, nullptr);
  try {
    service.SelectMatch(0);
    FAIL() << "matched on empty registry";
  } catch (const arena::PreconditionViolation& ex) {
    EXPECT_EQ(ex.code, "empty_registry");
  }
}

}  // namespace
