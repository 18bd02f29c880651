/*
 * 설명: 항목 가중치 조회와 범위/합계 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/category_weights_test.cpp
 */
#include "arena/category_weights.hpp"

#include <cmath>
#include <sstream>

#include "arena/errors.hpp"

namespace arena {
namespace {
constexpr double kSumTolerance = 1e-6;
}  // namespace

const char* CategoryName(Category category) {
  switch (category) {
    case Category::kTechnicalQuality:
      return "technical_quality";
    case Category::kConstructiveness:
      return "constructiveness";
    case Category::kClarity:
      return "clarity";
    case Category::kOverallQuality:
      return "overall_quality";
  }
  return "unknown";
}

double CategoryWeights::Get(Category category) const {
  switch (category) {
    case Category::kTechnicalQuality:
      return technical_quality;
    case Category::kConstructiveness:
      return constructiveness;
    case Category::kClarity:
      return clarity;
    case Category::kOverallQuality:
      return overall_quality;
  }
  return 0.0;
}

double CategoryWeights::Sum() const { return technical_quality + constructiveness + clarity + overall_quality; }

void ValidateWeights(const CategoryWeights& weights) {
  for (Category category : kAllCategories) {
    double value = weights.Get(category);
    if (!std::isfinite(value) || value <= 0.0 || value >= 1.0) {
      std::ostringstream oss;
      oss << "가중치 " << CategoryName(category) << "=" << value << " 는 (0,1) 범위를 벗어났습니다";
      throw ConfigurationError("invalid_weights", oss.str());
    }
  }
  double total = weights.Sum();
  if (std::fabs(total - 1.0) > kSumTolerance) {
    std::ostringstream oss;
    oss << "가중치 합은 1이어야 하지만 " << total << " 입니다";
    throw ConfigurationError("invalid_weights", oss.str());
  }
}

CategoryWeights MakeCategoryWeights(double technical_quality, double constructiveness, double clarity,
                                    double overall_quality) {
  CategoryWeights weights{technical_quality, constructiveness, clarity, overall_quality};
  ValidateWeights(weights);
  return weights;
}

}  // namespace arena
