/*
 * 설명: 투표를 comparisons 테이블에 저장하고 삽입 순서대로 재생용 이력을 조회한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/it/mariadb_vote_log_it_test.cpp
 */
#include "arena/mariadb_vote_log.hpp"

#include <sstream>

namespace arena {
namespace {
constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS comparisons ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " session_id VARCHAR(128) NOT NULL,"
    " paper_id VARCHAR(128) NOT NULL,"
    " reviewer_a VARCHAR(128) NOT NULL,"
    " reviewer_b VARCHAR(128) NOT NULL,"
    " technical_quality VARCHAR(64) NOT NULL,"
    " constructiveness VARCHAR(64) NOT NULL,"
    " clarity VARCHAR(64) NOT NULL,"
    " overall_quality VARCHAR(64) NOT NULL,"
    " review_a MEDIUMTEXT NOT NULL,"
    " review_b MEDIUMTEXT NOT NULL,"
    " vote_time DATETIME(6) NOT NULL"
    ") DEFAULT CHARSET=utf8mb4;";

std::string Column(MYSQL_ROW row, unsigned long* lengths, std::size_t index) {
  return row[index] ? std::string(row[index], lengths[index]) : std::string();
}
}  // namespace

MariaDbVoteLog::MariaDbVoteLog(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbVoteLog::EnsureSchema() const {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) { db_client_->Execute(conn, kCreateTableSql, "comparisons 테이블 생성 실패"); });
}

void MariaDbVoteLog::StoreVote(const Vote& vote) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    InsertVoteInTx(conn, vote);
    return true;
  });
}

void MariaDbVoteLog::InsertVoteInTx(MYSQL* conn, const Vote& vote) const {
  auto quote = [&](const std::string& value) { return "'" + db_client_->Escape(conn, value) + "'"; };
  std::ostringstream oss;
  oss << "INSERT INTO comparisons(session_id, paper_id, reviewer_a, reviewer_b, technical_quality, constructiveness,"
         " clarity, overall_quality, review_a, review_b, vote_time) VALUES ("
      << quote(vote.session_id) << ", " << quote(vote.paper_id) << ", " << quote(vote.reviewer_a) << ", "
      << quote(vote.reviewer_b) << ", " << quote(JudgementLabel(vote.technical_quality)) << ", "
      << quote(JudgementLabel(vote.constructiveness)) << ", " << quote(JudgementLabel(vote.clarity)) << ", "
      << quote(JudgementLabel(vote.overall_quality)) << ", " << quote(vote.review_a) << ", " << quote(vote.review_b)
      << ", '" << ToTimestamp(vote.vote_time) << "');";
  db_client_->Execute(conn, oss.str(), "투표 저장 실패");
}

std::vector<Vote> MariaDbVoteLog::GetAllVotes() const {
  std::vector<Vote> votes;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    votes.clear();
    db_client_->QueryRows(conn,
                          "SELECT session_id, paper_id, reviewer_a, reviewer_b, technical_quality, constructiveness,"
                          " clarity, overall_quality, review_a, review_b, vote_time FROM comparisons ORDER BY id;",
                          "투표 이력 조회 실패",
                          [&](MYSQL_ROW row, unsigned long* lengths) { votes.push_back(BuildVote(row, lengths)); });
  });
  return votes;
}

std::size_t MariaDbVoteLog::Count() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->QueryRows(conn, "SELECT COUNT(*) FROM comparisons;", "투표 카운트 실패",
                          [&](MYSQL_ROW row, unsigned long* /*lengths*/) {
                            count = row[0] ? static_cast<std::size_t>(std::stoull(row[0])) : 0;
                          });
  });
  return count;
}

void MariaDbVoteLog::ClearAll() const {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) { db_client_->Execute(conn, "DELETE FROM comparisons;", "투표 삭제 실패"); });
}

Vote MariaDbVoteLog::BuildVote(MYSQL_ROW row, unsigned long* lengths) const {
  Vote vote;
  vote.session_id = Column(row, lengths, 0);
  vote.paper_id = Column(row, lengths, 1);
  vote.reviewer_a = Column(row, lengths, 2);
  vote.reviewer_b = Column(row, lengths, 3);
  vote.technical_quality = ParseJudgement(Column(row, lengths, 4));
  vote.constructiveness = ParseJudgement(Column(row, lengths, 5));
  vote.clarity = ParseJudgement(Column(row, lengths, 6));
  vote.overall_quality = ParseJudgement(Column(row, lengths, 7));
  vote.review_a = Column(row, lengths, 8);
  vote.review_b = Column(row, lengths, 9);
  vote.vote_time = ParseVoteTime(Column(row, lengths, 10));
  return vote;
}

std::string MariaDbVoteLog::ToTimestamp(const std::chrono::system_clock::time_point& tp) const {
  std::string text = FormatVoteTime(tp);
  text[10] = ' ';
  return text;
}

}  // namespace arena
