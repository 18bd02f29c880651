/*
 * 설명: 리뷰 평가 4개 항목의 가중치와 합계 검증을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/category_weights_test.cpp
 */
#pragma once

#include <array>
#include <cstddef>

namespace arena {

enum class Category { kTechnicalQuality, kConstructiveness, kClarity, kOverallQuality };

constexpr std::size_t kCategoryCount = 4;
constexpr std::array<Category, kCategoryCount> kAllCategories{
    Category::kTechnicalQuality, Category::kConstructiveness, Category::kClarity, Category::kOverallQuality};

const char* CategoryName(Category category);

struct CategoryWeights {
  double technical_quality{0.2};
  double constructiveness{0.2};
  double clarity{0.2};
  double overall_quality{0.4};

  double Get(Category category) const;
  double Sum() const;
};

// 각 값이 (0,1) 범위이고 합이 1(허용 오차 1e-6)인지 확인한다. 실패 시 ConfigurationError.
void ValidateWeights(const CategoryWeights& weights);

CategoryWeights MakeCategoryWeights(double technical_quality, double constructiveness, double clarity,
                                    double overall_quality);

}  // namespace arena
