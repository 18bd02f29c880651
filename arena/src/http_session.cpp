/*
 * 설명: HTTP 요청을 읽어 아레나 서비스 엔드포인트로 분기하고 오류를 엔벨로프로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/e2e/arena_api_test.cpp
 */
#include "arena/http_session.hpp"

#include <optional>
#include <unordered_map>

#include <boost/beast/version.hpp>

#include "arena/api_response.hpp"
#include "arena/db_client.hpp"
#include "arena/errors.hpp"

namespace arena {

namespace {
namespace http = boost::beast::http;

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string UrlDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '+') {
      out.push_back(' ');
    } else if (text[i] == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 && HexValue(text[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
      i += 2;
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

void WriteJson(HttpSession::Response& res, http::status status, const nlohmann::json& body) {
  res.result(status);
  res.body() = body.dump();
  res.content_length(res.body().size());
}

ExclusionsByPaper ParseExclusions(const nlohmann::json& body) {
  ExclusionsByPaper exclusions;
  auto it = body.find("excludePairs");
  if (it == body.end() || it->is_null()) {
    return exclusions;
  }
  if (!it->is_object()) {
    throw PreconditionViolation("bad_request", "excludePairs는 논문 id별 쌍 목록 객체여야 합니다");
  }
  for (const auto& paper : it->items()) {
    if (!paper.value().is_array()) {
      throw PreconditionViolation("bad_request", "논문별 제외 목록은 배열이어야 합니다");
    }
    auto& pairs = exclusions[paper.key()];
    for (const auto& pair : paper.value()) {
      if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string() || !pair[1].is_string()) {
        throw PreconditionViolation("bad_request", "제외 쌍은 [reviewerA, reviewerB] 형식이어야 합니다");
      }
      pairs.emplace(pair[0].get<std::string>(), pair[1].get<std::string>());
    }
  }
  return exclusions;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ArenaService> arena_service,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), arena_service_(std::move(arena_service)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "review-arena");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  try {
    Route(*res, path, query);
  } catch (const PreconditionViolation& ex) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope(ex.code, ex.what()));
  } catch (const nlohmann::json::exception&) {
    WriteJson(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  } catch (const DbException& ex) {
    observability_->Log(LogLevel::kError, "vote_store_failed",
                        {{"traceId", trace_id_}, {"code", ex.code}, {"message", ex.what()}});
    WriteJson(*res, http::status::internal_server_error, MakeErrorEnvelope("db_error", "투표 저장소 오류입니다"));
  } catch (const std::exception& ex) {
    observability_->Log(LogLevel::kError, "request_failed", {{"traceId", trace_id_}, {"message", ex.what()}});
    WriteJson(*res, http::status::internal_server_error, MakeErrorEnvelope("internal_error", "서버 내부 오류입니다"));
  }
  SendResponse(res);
}

void HttpSession::Route(Response& res, const std::string& path, const std::string& query) {
  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }
  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(arena_service_->GetEngine()->ReviewerCount());
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(ToJson(snapshot)));
  }
  if (req_.method() == http::verb::get && path == "/api/leaderboard") {
    auto board = LeaderboardToJson(arena_service_->Leaderboard(), arena_service_->TotalVoteMass());
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(board));
  }
  if (req_.method() == http::verb::get && path == "/api/ratings") {
    return HandleRating(res, query);
  }
  if (req_.method() == http::verb::post && path == "/api/match") {
    return HandleMatch(res);
  }
  if (req_.method() == http::verb::post && path == "/api/votes") {
    return HandleVote(res);
  }
  WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleRating(Response& res, const std::string& query) {
  auto params = ParseQueryParams(query);
  auto it = params.find("reviewer");
  if (it == params.end() || it->second.empty()) {
    return WriteJson(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "reviewer 파라미터가 필요합니다"));
  }
  auto rating = arena_service_->GetEngine()->FindRating(it->second);
  if (!rating) {
    return WriteJson(res, http::status::not_found, MakeErrorEnvelope("reviewer_not_found", "등록되지 않은 리뷰어입니다"));
  }
  nlohmann::json data{{"reviewer", it->second}, {"rating", *rating}};
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
}

void HttpSession::HandleMatch(Response& res) {
  nlohmann::json body = req_.body().empty() ? nlohmann::json::object() : nlohmann::json::parse(req_.body());
  if (!body.is_object()) {
    throw PreconditionViolation("bad_request", "요청 본문은 JSON 객체여야 합니다");
  }
  ExclusionsByPaper exclusions = ParseExclusions(body);

  std::optional<MatchProposal> proposal;
  auto pos_it = body.find("paperPosition");
  auto dir_it = body.find("direction");
  bool has_direction = dir_it != body.end() && !dir_it->is_null();
  if (has_direction && (pos_it == body.end() || pos_it->is_null())) {
    throw PreconditionViolation("bad_request", "direction에는 paperPosition이 필요합니다");
  }
  if (pos_it != body.end() && !pos_it->is_null()) {
    if (!pos_it->is_number_unsigned()) {
      throw PreconditionViolation("bad_request", "paperPosition은 0 이상의 정수여야 합니다");
    }
    auto position = pos_it->get<std::size_t>();
    if (position >= arena_service_->GetPaperRegistry()->Count()) {
      return WriteJson(res, http::status::bad_request,
                       MakeErrorEnvelope("paper_range", "paperPosition이 논문 목록 범위를 벗어났습니다"));
    }
    // next/prev는 현재 위치에서 한 칸 이동한 뒤(순환) 탐색을 시작한다.
    if (has_direction) {
      std::string direction = dir_it->is_string() ? dir_it->get<std::string>() : std::string();
      if (direction == "next") {
        position = arena_service_->GetPaperRegistry()->NextPosition(position);
      } else if (direction == "prev") {
        position = arena_service_->GetPaperRegistry()->PreviousPosition(position);
      } else {
        throw PreconditionViolation("bad_request", "direction은 next 또는 prev여야 합니다");
      }
    }
    proposal = arena_service_->SelectMatch(position, exclusions);
  } else {
    proposal = arena_service_->SelectRandomMatch(exclusions);
  }

  if (!proposal) {
    return WriteJson(res, http::status::not_found,
                     MakeErrorEnvelope("pair_not_found", "공정한 리뷰어 쌍을 가진 논문을 찾지 못했습니다"));
  }
  WriteJson(res, http::status::ok, MakeSuccessEnvelope(ToJson(*proposal)));
}

void HttpSession::HandleVote(Response& res) {
  Vote vote = VoteFromJson(nlohmann::json::parse(req_.body()));
  UpdateResult result = arena_service_->SubmitVote(vote);
  nlohmann::json data{{"reviewerA", vote.reviewer_a},
                      {"reviewerB", vote.reviewer_b},
                      {"normalizedScore", result.normalized_score},
                      {"ratingA", result.rating_a},
                      {"ratingB", result.rating_b}};
  WriteJson(res, http::status::created, MakeSuccessEnvelope(data));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.name = "http_request";
  ctx.latency_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  ctx.fields = {{"method", std::string(req_.method_string())},
                {"target", std::string(req_.target())},
                {"status", res->result_int()}};
  observability_->Log(ctx);
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace arena
