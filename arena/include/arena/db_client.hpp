/*
 * 설명: 투표 로그용 MariaDB 연결, 쿼리 헬퍼, 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/db_client_test.cpp, arena/tests/it/mariadb_vote_log_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace arena {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// 오류가 난 단계. 커밋 도중 연결이 끊기면 서버에 반영됐는지 알 수 없다.
enum class DbPhase { kStatement, kCommit };

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work가 true를 반환하면 커밋, false면 롤백한다. 재시도 가능한 오류는 최대 3회까지 다시 시도한다.
  // 커밋 중 연결이 끊긴 경우는 중복 기록을 막기 위해 재시도하지 않는다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  void QueryRows(MYSQL* conn, const std::string& sql, const std::string& ctx,
                 const std::function<void(MYSQL_ROW, unsigned long*)>& on_row) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx, DbPhase phase = DbPhase::kStatement) const;
  // 커밋 단계에서는 교착/락 대기처럼 롤백이 확실한 오류만 재시도한다.
  static bool IsRetryable(unsigned int code, DbPhase phase);
  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  using Connection = std::unique_ptr<MYSQL, void (*)(MYSQL*)>;

  Connection Connect() const;
  // 재시도 가능한 DbException이면 백오프 후 fn을 다시 호출한다.
  template <typename Fn>
  auto RunWithRetry(Fn&& fn) const -> decltype(fn());
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
};

}  // namespace arena
