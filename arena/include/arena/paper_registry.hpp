/*
 * 설명: 비교 대상 논문과 리뷰 시스템별 리뷰 목록을 보관하고 논문별 유효 리뷰어 집합을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/paper_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "arena/random_source.hpp"

namespace arena {

std::vector<std::string> DefaultReviewerFields();

struct Paper {
  std::string paper_id;
  std::string title;
  std::string pdf_path;
  std::map<std::string, std::vector<std::string>> reviews;

  // 공백이 아닌 리뷰가 하나 이상 있는 리뷰 시스템만 반환한다.
  std::set<std::string> ValidReviewerIds() const;
  std::vector<std::string> NonBlankReviews(const std::string& reviewer_id) const;
};

Paper PaperFromJson(const nlohmann::json& json, const std::vector<std::string>& reviewer_fields);

class PaperRegistry {
 public:
  PaperRegistry() = default;
  explicit PaperRegistry(std::vector<Paper> papers) : papers_(std::move(papers)) {}

  static PaperRegistry FromJsonl(const std::string& file_path,
                                 const std::vector<std::string>& reviewer_fields = DefaultReviewerFields());

  std::size_t Count() const { return papers_.size(); }
  const std::vector<Paper>& Papers() const { return papers_; }
  const Paper& At(std::size_t position) const;

  std::size_t SamplePosition(RandomSource& random) const;
  std::size_t NextPosition(std::size_t position) const;
  std::size_t PreviousPosition(std::size_t position) const;

 private:
  void RequireNotEmpty() const;

  std::vector<Paper> papers_;
};

}  // namespace arena
