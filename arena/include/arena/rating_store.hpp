/*
 * 설명: 리뷰어별 현재 레이팅과 누적 투표량을 보관한다. I/O 없이 값과 산술만 다룬다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/rating_store_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace arena {

class RatingStore {
 public:
  explicit RatingStore(double initial_rating) : initial_rating_(initial_rating) {}

  // 처음 참조되는 리뷰어는 초기 레이팅으로 생성된다.
  double& RatingOf(const std::string& id);
  std::optional<double> FindRating(const std::string& id) const;
  double VoteMassOf(const std::string& id) const;
  void AddVoteMass(const std::string& id, double amount);

  bool Empty() const { return ratings_.empty(); }
  std::size_t Size() const { return ratings_.size(); }
  double MinRating() const;
  double MaxRating() const;
  double InitialRating() const { return initial_rating_; }

  const std::map<std::string, double>& Ratings() const { return ratings_; }
  void Clear();

 private:
  double initial_rating_;
  std::map<std::string, double> ratings_;
  std::map<std::string, double> vote_mass_;
};

}  // namespace arena
