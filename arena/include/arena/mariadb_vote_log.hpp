/*
 * 설명: comparisons 테이블에 투표를 추가하고 id 순서로 전체 이력을 읽는 MariaDB 투표 로그.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/it/mariadb_vote_log_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "arena/db_client.hpp"
#include "arena/vote_log.hpp"

namespace arena {

class MariaDbVoteLog : public VoteLog {
 public:
  explicit MariaDbVoteLog(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() const;
  void StoreVote(const Vote& vote) override;
  void InsertVoteInTx(MYSQL* conn, const Vote& vote) const;
  std::vector<Vote> GetAllVotes() const override;

  std::size_t Count() const;
  void ClearAll() const;

 private:
  Vote BuildVote(MYSQL_ROW row, unsigned long* lengths) const;
  std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace arena
