/*
 * 설명: JSONL 논문 목록을 읽고 위치 이동(순환)과 유효 리뷰어 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/paper_registry_test.cpp
 */
#include "arena/paper_registry.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "arena/errors.hpp"

namespace arena {
namespace {
bool IsBlank(const std::string& text) { return text.find_first_not_of(" \t\r\n") == std::string::npos; }

std::string StringField(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return {};
  }
  return it->get<std::string>();
}
}  // namespace

std::vector<std::string> DefaultReviewerFields() {
  return {"human_reviewer", "barebones", "liang_etal", "multi_agent_without_knowledge"};
}

std::set<std::string> Paper::ValidReviewerIds() const {
  std::set<std::string> ids;
  for (const auto& entry : reviews) {
    for (const auto& review : entry.second) {
      if (!IsBlank(review)) {
        ids.insert(entry.first);
        break;
      }
    }
  }
  return ids;
}

std::vector<std::string> Paper::NonBlankReviews(const std::string& reviewer_id) const {
  std::vector<std::string> result;
  auto it = reviews.find(reviewer_id);
  if (it == reviews.end()) {
    return result;
  }
  for (const auto& review : it->second) {
    if (!IsBlank(review)) {
      result.push_back(review);
    }
  }
  return result;
}

Paper PaperFromJson(const nlohmann::json& json, const std::vector<std::string>& reviewer_fields) {
  Paper paper;
  paper.paper_id = json.at("paper_id").get<std::string>();
  paper.title = StringField(json, "title");
  paper.pdf_path = StringField(json, "pdf_path");
  for (const auto& field : reviewer_fields) {
    auto it = json.find(field);
    if (it == json.end() || it->is_null()) {
      paper.reviews[field] = {};
      continue;
    }
    paper.reviews[field] = it->get<std::vector<std::string>>();
  }
  return paper;
}

PaperRegistry PaperRegistry::FromJsonl(const std::string& file_path, const std::vector<std::string>& reviewer_fields) {
  std::ifstream in(file_path);
  if (!in) {
    throw std::runtime_error("논문 목록 파일을 열 수 없습니다: " + file_path);
  }
  std::vector<Paper> papers;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (IsBlank(line)) {
      continue;
    }
    try {
      papers.push_back(PaperFromJson(nlohmann::json::parse(line), reviewer_fields));
    } catch (const nlohmann::json::exception& ex) {
      std::ostringstream oss;
      oss << file_path << ":" << line_no << " 논문 레코드 파싱 실패: " << ex.what();
      throw std::runtime_error(oss.str());
    }
  }
  return PaperRegistry(std::move(papers));
}

void PaperRegistry::RequireNotEmpty() const {
  if (papers_.empty()) {
    throw PreconditionViolation("empty_registry", "논문 목록이 비어 있습니다");
  }
}

const Paper& PaperRegistry::At(std::size_t position) const {
  RequireNotEmpty();
  if (position >= papers_.size()) {
    throw std::out_of_range("논문 위치가 범위를 벗어났습니다: " + std::to_string(position));
  }
  return papers_[position];
}

std::size_t PaperRegistry::SamplePosition(RandomSource& random) const {
  RequireNotEmpty();
  return random.UniformIndex(papers_.size());
}

std::size_t PaperRegistry::NextPosition(std::size_t position) const {
  RequireNotEmpty();
  return position + 1 < papers_.size() ? position + 1 : 0;
}

std::size_t PaperRegistry::PreviousPosition(std::size_t position) const {
  RequireNotEmpty();
  return position > 0 ? position - 1 : papers_.size() - 1;
}

}  // namespace arena
