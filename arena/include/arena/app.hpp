/*
 * 설명: 아레나 서버 전체 수명주기(투표 로그 재생, 리스너, 워커 스레드)를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/arena_api_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "arena/arena_service.hpp"
#include "arena/config.hpp"
#include "arena/observability.hpp"
#include "arena/vote_log.hpp"

namespace arena {

class Listener;

class ArenaApp {
 public:
  // 설정/논문 파일/투표 로그 오류는 생성 시점에 예외로 드러난다.
  explicit ArenaApp(const ArenaConfig& config);
  ~ArenaApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const ArenaConfig& GetConfig() const { return config_; }
  std::shared_ptr<ArenaService> GetArenaService() { return arena_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  std::size_t ReplayedVotes() const { return replayed_votes_; }

 private:
  std::shared_ptr<VoteLog> BuildVoteLog();
  void RunWorkers();

  ArenaConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ArenaService> arena_service_;
  std::size_t replayed_votes_{0};
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace arena
