/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭/리더보드/레이팅/매칭/투표 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/arena_api_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "arena/arena_service.hpp"
#include "arena/observability.hpp"

namespace arena {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ArenaService> arena_service,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(Response& res, const std::string& path, const std::string& query);
  void HandleMatch(Response& res);
  void HandleVote(Response& res);
  void HandleRating(Response& res, const std::string& query);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<ArenaService> arena_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace arena
