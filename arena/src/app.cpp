/*
 * 설명: 아레나 서버 수명주기, 리스닝 스레드, 환경설정 로딩을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/arena_api_test.cpp, arena/tests/unit/config_test.cpp
 */
#include "arena/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "arena/db_client.hpp"
#include "arena/errors.hpp"
#include "arena/http_session.hpp"
#include "arena/mariadb_vote_log.hpp"
#include "arena/paper_registry.hpp"
#include "arena/random_source.hpp"
#include "arena/rating_engine.hpp"

namespace arena {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<ArenaService> arena_service, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), arena_service_(std::move(arena_service)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->arena_service_, self->observability_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<ArenaService> arena_service_;
  std::shared_ptr<Observability> observability_;
};

ArenaApp::ArenaApp(const ArenaConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  auto vote_log = BuildVoteLog();
  auto papers = std::make_shared<PaperRegistry>(PaperRegistry::FromJsonl(config.papers_path));
  auto random = std::make_shared<MtRandomSource>(config.random_seed);
  auto engine = std::make_shared<RatingEngine>(BuildEloSettings(config), random);
  arena_service_ = std::make_shared<ArenaService>(vote_log, papers, engine, random, observability_);
  replayed_votes_ = arena_service_->Bootstrap();
  observability_->Log(LogLevel::kInfo, "papers_loaded", {{"path", config.papers_path}, {"papers", papers->Count()}});
}

ArenaApp::~ArenaApp() { Stop(); }

std::shared_ptr<VoteLog> ArenaApp::BuildVoteLog() {
  if (config_.vote_store == "jsonl") {
    return std::make_shared<JsonlVoteLog>(config_.votes_path);
  }
  if (config_.vote_store == "mariadb") {
    DbConfig db_config{config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name};
    auto vote_log = std::make_shared<MariaDbVoteLog>(std::make_shared<MariaDbClient>(db_config));
    vote_log->EnsureSchema();
    return vote_log;
  }
  throw ConfigurationError("invalid_config", "VOTE_STORE는 jsonl 또는 mariadb여야 합니다: " + config_.vote_store);
}

void ArenaApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, arena_service_, observability_);
    listener_->Run();
    observability_->Log(LogLevel::kInfo, "server_started",
                        {{"port", config_.port}, {"voteStore", config_.vote_store}, {"replayedVotes", replayed_votes_}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ArenaApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ArenaApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

namespace {

std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

unsigned long long ParseUnsigned(const char* key, const std::string& text, unsigned long long max_value) {
  std::size_t consumed = 0;
  unsigned long long value = 0;
  try {
    if (!text.empty() && text[0] == '-') {
      throw std::invalid_argument("negative");
    }
    value = std::stoull(text, &consumed);
  } catch (const std::logic_error&) {
    throw ConfigurationError("invalid_config", std::string(key) + " 값이 정수가 아닙니다: " + text);
  }
  if (consumed != text.size() || value > max_value) {
    throw ConfigurationError("invalid_config", std::string(key) + " 값이 허용 범위를 벗어났습니다: " + text);
  }
  return value;
}

double ParseDouble(const char* key, const std::string& text) {
  std::size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::logic_error&) {
    throw ConfigurationError("invalid_config", std::string(key) + " 값이 숫자가 아닙니다: " + text);
  }
  if (consumed != text.size()) {
    throw ConfigurationError("invalid_config", std::string(key) + " 값이 숫자가 아닙니다: " + text);
  }
  return value;
}

unsigned short ParsePort(const char* key, const std::string& text) {
  return static_cast<unsigned short>(ParseUnsigned(key, text, std::numeric_limits<unsigned short>::max()));
}

}  // namespace

ArenaConfig LoadConfigFromEnv() {
  ArenaConfig cfg;
  cfg.port = ParsePort("SERVER_PORT", GetEnv("SERVER_PORT", "8080"));
  cfg.vote_store = GetEnv("VOTE_STORE", "jsonl");
  cfg.votes_path = GetEnv("VOTES_PATH", "arena_votes.jsonl");
  cfg.papers_path = GetEnv("PAPERS_PATH", "paper_reviews.jsonl");
  cfg.db_host = GetEnv("DB_HOST", "mariadb");
  cfg.db_port = ParsePort("DB_PORT", GetEnv("DB_PORT", "3306"));
  cfg.db_user = GetEnv("DB_USER", "app");
  cfg.db_password = GetEnv("DB_PASSWORD", "app_pass");
  cfg.db_name = GetEnv("DB_NAME", "app_db");
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.k_factor = ParseDouble("ELO_K_FACTOR", GetEnv("ELO_K_FACTOR", "32"));
  cfg.initial_rating = ParseDouble("ELO_INITIAL_RATING", GetEnv("ELO_INITIAL_RATING", "1500"));
  cfg.weight_technical_quality = ParseDouble("WEIGHT_TECHNICAL_QUALITY", GetEnv("WEIGHT_TECHNICAL_QUALITY", "0.2"));
  cfg.weight_constructiveness = ParseDouble("WEIGHT_CONSTRUCTIVENESS", GetEnv("WEIGHT_CONSTRUCTIVENESS", "0.2"));
  cfg.weight_clarity = ParseDouble("WEIGHT_CLARITY", GetEnv("WEIGHT_CLARITY", "0.2"));
  cfg.weight_overall_quality = ParseDouble("WEIGHT_OVERALL_QUALITY", GetEnv("WEIGHT_OVERALL_QUALITY", "0.4"));
  cfg.fair_match_step = ParseDouble("FAIR_MATCH_STEP", GetEnv("FAIR_MATCH_STEP", "10"));
  cfg.fair_pair_max_attempts = static_cast<std::size_t>(ParseUnsigned(
      "FAIR_PAIR_MAX_ATTEMPTS", GetEnv("FAIR_PAIR_MAX_ATTEMPTS", "100"), std::numeric_limits<std::size_t>::max()));
  cfg.random_seed = static_cast<std::uint64_t>(
      ParseUnsigned("RANDOM_SEED", GetEnv("RANDOM_SEED", "0"), std::numeric_limits<std::uint64_t>::max()));
  return cfg;
}

EloSettings BuildEloSettings(const ArenaConfig& config) {
  EloSettings settings;
  settings.weights = MakeCategoryWeights(config.weight_technical_quality, config.weight_constructiveness,
                                         config.weight_clarity, config.weight_overall_quality);
  settings.k_factor = config.k_factor;
  settings.initial_rating = config.initial_rating;
  settings.fair_match_step = config.fair_match_step;
  settings.max_attempts = config.fair_pair_max_attempts;
  return settings;
}

}  // namespace arena
