/*
 * 설명: 시간순 투표 로그 저장소 인터페이스와 메모리/JSONL 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/jsonl_vote_log_test.cpp, arena/tests/unit/arena_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "arena/vote.hpp"

namespace arena {

class VoteLog {
 public:
  virtual ~VoteLog() = default;

  virtual void StoreVote(const Vote& vote) = 0;
  // 저장된 순서 그대로 반환한다. 재생 결과가 이 순서에 의존한다.
  virtual std::vector<Vote> GetAllVotes() const = 0;
};

class InMemoryVoteLog : public VoteLog {
 public:
  InMemoryVoteLog() = default;
  explicit InMemoryVoteLog(std::vector<Vote> votes) : votes_(std::move(votes)) {}

  void StoreVote(const Vote& vote) override;
  std::vector<Vote> GetAllVotes() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<Vote> votes_;
};

class JsonlVoteLog : public VoteLog {
 public:
  // 파일이 없으면 빈 파일을 만든다.
  explicit JsonlVoteLog(std::string file_path);

  void StoreVote(const Vote& vote) override;
  std::vector<Vote> GetAllVotes() const override;
  const std::string& FilePath() const { return file_path_; }

 private:
  std::string file_path_;
  mutable std::mutex mutex_;
};

}  // namespace arena
