/*
 * 설명: 레이팅 저장소의 지연 생성 조회와 최소/최대 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_store_test.cpp
 */
#include "arena/rating_store.hpp"

#include <algorithm>

namespace arena {

double& RatingStore::RatingOf(const std::string& id) {
  auto it = ratings_.find(id);
  if (it == ratings_.end()) {
    it = ratings_.emplace(id, initial_rating_).first;
  }
  return it->second;
}

std::optional<double> RatingStore::FindRating(const std::string& id) const {
  auto it = ratings_.find(id);
  if (it == ratings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

double RatingStore::VoteMassOf(const std::string& id) const {
  auto it = vote_mass_.find(id);
  return it == vote_mass_.end() ? 0.0 : it->second;
}

void RatingStore::AddVoteMass(const std::string& id, double amount) { vote_mass_[id] += amount; }

double RatingStore::MinRating() const {
  if (ratings_.empty()) {
    return initial_rating_;
  }
  return std::min_element(ratings_.begin(), ratings_.end(),
                          [](const auto& lhs, const auto& rhs) { return lhs.second < rhs.second; })
      ->second;
}

double RatingStore::MaxRating() const {
  if (ratings_.empty()) {
    return initial_rating_;
  }
  return std::max_element(ratings_.begin(), ratings_.end(),
                          [](const auto& lhs, const auto& rhs) { return lhs.second < rhs.second; })
      ->second;
}

void RatingStore::Clear() {
  ratings_.clear();
  vote_mass_.clear();
}

}  // namespace arena
