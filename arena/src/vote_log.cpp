/*
 * 설명: 메모리 투표 로그와 한 줄당 JSON 객체 하나를 쓰는 JSONL 투표 로그를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/jsonl_vote_log_test.cpp, arena/tests/unit/arena_service_test.cpp
 */
#include "arena/vote_log.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "arena/errors.hpp"

namespace arena {

void InMemoryVoteLog::StoreVote(const Vote& vote) {
  std::lock_guard<std::mutex> lock(mutex_);
  votes_.push_back(vote);
}

std::vector<Vote> InMemoryVoteLog::GetAllVotes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return votes_;
}

JsonlVoteLog::JsonlVoteLog(std::string file_path) : file_path_(std::move(file_path)) {
  std::ofstream touch(file_path_, std::ios::app);
  if (!touch) {
    throw std::runtime_error("투표 로그 파일을 열 수 없습니다: " + file_path_);
  }
}

void JsonlVoteLog::StoreVote(const Vote& vote) {
  std::string line = VoteToJson(vote).dump();
  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream out(file_path_, std::ios::app);
  if (!out) {
    throw std::runtime_error("투표 로그 파일을 열 수 없습니다: " + file_path_);
  }
  out << line << '\n';
  out.flush();
  if (!out) {
    throw std::runtime_error("투표 로그 기록 실패: " + file_path_);
  }
}

std::vector<Vote> JsonlVoteLog::GetAllVotes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(file_path_);
  if (!in) {
    throw std::runtime_error("투표 로그 파일을 열 수 없습니다: " + file_path_);
  }
  std::vector<Vote> votes;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      votes.push_back(VoteFromJson(nlohmann::json::parse(line)));
    } catch (const nlohmann::json::exception& ex) {
      std::ostringstream oss;
      oss << file_path_ << ":" << line_no << " JSON 파싱 실패: " << ex.what();
      throw PreconditionViolation("invalid_vote", oss.str());
    } catch (const PreconditionViolation& ex) {
      std::ostringstream oss;
      oss << file_path_ << ":" << line_no << " " << ex.what();
      throw PreconditionViolation(ex.code, oss.str());
    }
  }
  return votes;
}

}  // namespace arena
