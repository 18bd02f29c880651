/*
 * 설명: MariaDB 연결, 결과 행 순회, 재시도/백오프 로직을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/db_client_test.cpp, arena/tests/it/mariadb_vote_log_it_test.cpp
 */
#include "arena/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace arena {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::Connection MariaDbClient::Connect() const {
  Connection conn(mysql_init(nullptr), &mysql_close);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  Execute(conn.get(), "SET SESSION innodb_lock_wait_timeout=2;", "락 대기 타임아웃 설정 실패");
  return conn;
}

namespace {
// commit되지 않은 채 범위를 벗어나면 롤백한다.
class TransactionGuard {
 public:
  explicit TransactionGuard(MYSQL* conn) : conn_(conn) { mysql_autocommit(conn_, 0); }
  ~TransactionGuard() {
    if (!finished_) {
      mysql_rollback(conn_);
    }
  }
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  bool Commit() {
    finished_ = true;
    return mysql_commit(conn_) == 0;
  }
  void Rollback() {
    finished_ = true;
    mysql_rollback(conn_);
  }

 private:
  MYSQL* conn_;
  bool finished_ = false;
};
}  // namespace

template <typename Fn>
auto MariaDbClient::RunWithRetry(Fn&& fn) const -> decltype(fn()) {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
      Backoff(attempt);
    }
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  return RunWithRetry([&]() {
    Connection conn = Connect();
    TransactionGuard tx(conn.get());
    if (!work(conn.get())) {
      tx.Rollback();
      return false;
    }
    if (!tx.Commit()) {
      RaiseError(conn.get(), "커밋 실패", DbPhase::kCommit);
    }
    return true;
  });
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry([&]() {
    Connection conn = Connect();
    work(conn.get());
  });
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
    RaiseError(conn, ctx);
  }
}

void MariaDbClient::QueryRows(MYSQL* conn, const std::string& sql, const std::string& ctx,
                              const std::function<void(MYSQL_ROW, unsigned long*)>& on_row) const {
  Execute(conn, sql, ctx);
  std::unique_ptr<MYSQL_RES, void (*)(MYSQL_RES*)> res(mysql_store_result(conn), &mysql_free_result);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get())) != nullptr) {
    on_row(row, mysql_fetch_lengths(res.get()));
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx, DbPhase phase) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code, phase);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code, DbPhase phase) {
  if (code == kDeadlock || code == kLockWaitTimeout) {
    return true;
  }
  if (phase == DbPhase::kCommit) {
    return false;
  }
  return code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR || code == CR_CONN_HOST_ERROR ||
         code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  // 50ms, 100ms, ... 에 0~25ms 지터를 더한다.
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

}  // namespace arena
