#include <chrono>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "arena/app.hpp"
#include "arena/vote.hpp"

namespace {

std::string WritePapers(const std::string& path) {
  nlohmann::json matchable{{"paper_id", "p-1"},
                           {"title", "Attention Is Enough"},
                           {"pdf_path", "papers/p-1.pdf"},
                           {"human_reviewer", nlohmann::json::array({"careful human review"})},
                           {"barebones", nlohmann::json::array({"barebones review"})},
                           {"liang_etal", nlohmann::json::array({" "})}};
  nlohmann::json lonely{{"paper_id", "p-2"},
                        {"title", "Single Reviewer"},
                        {"human_reviewer", nlohmann::json::array({"only human"})}};
  std::ofstream out(path, std::ios::trunc);
  out << matchable.dump() << "\n" << lonely.dump() << "\n";
  return path;
}

arena::ArenaConfig TestConfig(unsigned short port) {
  arena::ArenaConfig cfg{};
  cfg.port = port;
  cfg.vote_store = "jsonl";
  cfg.votes_path = ::testing::TempDir() + "arena_e2e_votes.jsonl";
  cfg.papers_path = WritePapers(::testing::TempDir() + "arena_e2e_papers.jsonl");
  cfg.db_host = "localhost";
  cfg.db_port = 3306;
  cfg.db_user = "app";
  cfg.db_password = "app_pass";
  cfg.db_name = "app_db";
  cfg.log_level = "warn";
  cfg.k_factor = 32.0;
  cfg.initial_rating = 1500.0;
  cfg.weight_technical_quality = 0.2;
  cfg.weight_constructiveness = 0.2;
  cfg.weight_clarity = 0.2;
  cfg.weight_overall_quality = 0.4;
  cfg.fair_match_step = 10.0;
  cfg.fair_pair_max_attempts = 100;
  cfg.random_seed = 5;
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  ASSERT_TRUE(body.contains("success"));
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_null());
}

void ExpectErrorCode(const SimpleHttpResponse& res, boost::beast::http::status status, const std::string& code) {
  EXPECT_EQ(res.status, status);
  ASSERT_TRUE(res.body.is_object());
  EXPECT_FALSE(res.body["success"].get<bool>());
  EXPECT_EQ(res.body["error"]["code"], code);
}

nlohmann::json VoteBody(const std::string& a, const std::string& b, const std::string& label) {
  return nlohmann::json{{"session_id", "e2e"},     {"paper_id", "p-1"},        {"reviewer_a", a},
                        {"reviewer_b", b},         {"technical_quality", label}, {"constructiveness", label},
                        {"clarity", label},        {"overall_quality", label},   {"review_a", "ra"},
                        {"review_b", "rb"}};
}

class ArenaApiFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18090);
    std::remove(config_.votes_path.c_str());
    StartServer();
  }

  void TearDown() override { StopServer(); }

  void StartServer() {
    app_ = std::make_unique<arena::ArenaApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
  }

  void StopServer() {
    if (app_) {
      app_->Stop();
    }
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    app_.reset();
  }

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target, const std::string& body) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (verb == boost::beast::http::verb::post) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body;
    }
    req.prepare_payload();

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body) {
    return Send(boost::beast::http::verb::post, target, body.dump());
  }

  SimpleHttpResponse Get(const std::string& target) { return Send(boost::beast::http::verb::get, target, ""); }

  arena::ArenaConfig config_{};
  std::unique_ptr<arena::ArenaApp> app_;
  std::thread server_thread_;
};

TEST_F(ArenaApiFixture, HealthAndMetrics) {
  auto health = Get("/api/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(health.body);
  EXPECT_EQ(health.body["data"]["status"], "ok");

  auto metrics = Get("/metrics");
  ASSERT_EQ(metrics.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(metrics.body);
  EXPECT_GE(metrics.body["data"]["requests"]["total"].get<int>(), 2);
  EXPECT_EQ(metrics.body["data"]["reviewers"], 0);
}

TEST_F(ArenaApiFixture, MatchVoteAndLeaderboardFlow) {
  // p-2는 유효 리뷰어가 하나뿐이므로 다음 논문(p-1)으로 넘어간다.
  auto match = PostJson("/api/match", {{"paperPosition", 1}});
  ASSERT_EQ(match.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(match.body);
  const auto& proposal = match.body["data"];
  EXPECT_EQ(proposal["paperPosition"], 0);
  EXPECT_EQ(proposal["paperId"], "p-1");
  EXPECT_EQ(proposal["title"], "Attention Is Enough");
  std::string reviewer_a = proposal["reviewerA"].get<std::string>();
  std::string reviewer_b = proposal["reviewerB"].get<std::string>();
  EXPECT_NE(reviewer_a, reviewer_b);
  EXPECT_TRUE(reviewer_a == "human_reviewer" || reviewer_a == "barebones");
  EXPECT_TRUE(reviewer_b == "human_reviewer" || reviewer_b == "barebones");

  auto vote = PostJson("/api/votes", VoteBody(reviewer_a, reviewer_b, arena::JudgementLabel(arena::Judgement::kABetter)));
  ASSERT_EQ(vote.status, boost::beast::http::status::created);
  ExpectSuccessEnvelope(vote.body);
  EXPECT_DOUBLE_EQ(vote.body["data"]["ratingA"].get<double>(), 1516.0);
  EXPECT_DOUBLE_EQ(vote.body["data"]["ratingB"].get<double>(), 1484.0);
  EXPECT_DOUBLE_EQ(vote.body["data"]["normalizedScore"].get<double>(), 1.0);

  auto leaderboard = Get("/api/leaderboard");
  ASSERT_EQ(leaderboard.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(leaderboard.body);
  auto entries = leaderboard.body["data"]["entries"];
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0]["reviewer"], reviewer_a);
  EXPECT_EQ(entries[0]["rank"], 1);
  EXPECT_DOUBLE_EQ(entries[0]["rating"].get<double>(), 1516.0);
  EXPECT_NEAR(entries[0]["ci95"][0].get<double>(), 1516.0 - 62.72, 1e-9);
  EXPECT_EQ(entries[1]["reviewer"], reviewer_b);
  EXPECT_DOUBLE_EQ(entries[1]["ci95"][0].get<double>(), 1484.0);

  auto rating = Get("/api/ratings?reviewer=" + reviewer_b);
  ASSERT_EQ(rating.status, boost::beast::http::status::ok);
  EXPECT_DOUBLE_EQ(rating.body["data"]["rating"].get<double>(), 1484.0);

  // 조회만으로는 리더보드에 새 리뷰어가 생기지 않는다.
  auto unseen = Get("/api/ratings?reviewer=multi_agent_without_knowledge");
  ExpectErrorCode(unseen, boost::beast::http::status::not_found, "reviewer_not_found");
  auto after_lookup = Get("/api/leaderboard");
  EXPECT_EQ(after_lookup.body["data"]["total"], 2);
  EXPECT_DOUBLE_EQ(after_lookup.body["data"]["totalVotes"].get<double>(), 1.0);

  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.body["data"]["votes"]["applied"], 1);
  EXPECT_GE(metrics.body["data"]["matching"]["notFound"].get<int>(), 1);
}

TEST_F(ArenaApiFixture, RestartReplaysVoteLog) {
  auto first = PostJson("/api/votes", VoteBody("human_reviewer", "barebones", "👉  B is better"));
  ASSERT_EQ(first.status, boost::beast::http::status::created);
  auto second = PostJson("/api/votes", VoteBody("barebones", "liang_etal", "🤝  Tie"));
  ASSERT_EQ(second.status, boost::beast::http::status::created);
  auto before = app_->GetArenaService()->GetEngine()->Ratings();

  StopServer();
  arena::ArenaApp restarted(config_);
  EXPECT_EQ(restarted.ReplayedVotes(), 2u);
  EXPECT_EQ(restarted.GetArenaService()->GetEngine()->Ratings(), before);
}

TEST_F(ArenaApiFixture, RejectsInvalidVotes) {
  auto self = PostJson("/api/votes", VoteBody("barebones", "barebones", "🤝  Tie"));
  ExpectErrorCode(self, boost::beast::http::status::bad_request, "self_comparison");

  auto label = PostJson("/api/votes", VoteBody("barebones", "human_reviewer", "A is better"));
  ExpectErrorCode(label, boost::beast::http::status::bad_request, "invalid_judgement");

  auto missing = PostJson("/api/votes", {{"reviewer_a", "barebones"}});
  ExpectErrorCode(missing, boost::beast::http::status::bad_request, "invalid_vote");

  auto malformed = Send(boost::beast::http::verb::post, "/api/votes", "{not json");
  ExpectErrorCode(malformed, boost::beast::http::status::bad_request, "bad_request");

  auto board = Get("/api/leaderboard");
  EXPECT_EQ(board.body["data"]["total"], 0);
}

TEST_F(ArenaApiFixture, DirectionStepsFromCurrentPaper) {
  // p-1에서 next는 p-2로 가지만 매칭할 수 없어 한 바퀴 돌아 p-1로 온다.
  auto next = PostJson("/api/match", {{"paperPosition", 0}, {"direction", "next"}});
  ASSERT_EQ(next.status, boost::beast::http::status::ok);
  EXPECT_EQ(next.body["data"]["paperPosition"], 0);

  auto prev = PostJson("/api/match", {{"paperPosition", 1}, {"direction", "prev"}});
  ASSERT_EQ(prev.status, boost::beast::http::status::ok);
  EXPECT_EQ(prev.body["data"]["paperId"], "p-1");

  // 첫 논문에서 prev는 마지막 논문(p-2)으로 순환한 뒤 p-1까지 간다.
  auto wrapped = PostJson("/api/match", {{"paperPosition", 0}, {"direction", "prev"}});
  ASSERT_EQ(wrapped.status, boost::beast::http::status::ok);
  EXPECT_EQ(wrapped.body["data"]["paperPosition"], 0);

  auto sideways = PostJson("/api/match", {{"paperPosition", 0}, {"direction", "sideways"}});
  ExpectErrorCode(sideways, boost::beast::http::status::bad_request, "bad_request");

  auto no_position = PostJson("/api/match", {{"direction", "next"}});
  ExpectErrorCode(no_position, boost::beast::http::status::bad_request, "bad_request");

  auto out_of_range = PostJson("/api/match", {{"paperPosition", 2}, {"direction", "prev"}});
  ExpectErrorCode(out_of_range, boost::beast::http::status::bad_request, "paper_range");
}

TEST_F(ArenaApiFixture, MatchErrors) {
  auto out_of_range = PostJson("/api/match", {{"paperPosition", 9}});
  ExpectErrorCode(out_of_range, boost::beast::http::status::bad_request, "paper_range");

  nlohmann::json exclude{{"p-1", nlohmann::json::array({nlohmann::json::array({"barebones", "human_reviewer"})})}};
  auto exhausted = PostJson("/api/match", {{"paperPosition", 0}, {"excludePairs", exclude}});
  ExpectErrorCode(exhausted, boost::beast::http::status::not_found, "pair_not_found");

  auto bad_exclude = PostJson("/api/match", {{"excludePairs", nlohmann::json::array({"oops"})}});
  ExpectErrorCode(bad_exclude, boost::beast::http::status::bad_request, "bad_request");

  auto no_reviewer = Get("/api/ratings");
  ExpectErrorCode(no_reviewer, boost::beast::http::status::bad_request, "bad_request");

  auto unknown = Get("/api/unknown");
  ExpectErrorCode(unknown, boost::beast::http::status::not_found, "not_found");
}

}  // namespace
