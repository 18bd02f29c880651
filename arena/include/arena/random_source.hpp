/*
 * 설명: 페어 선택과 리뷰 샘플링에 쓰는 난수원을 추상화한다. 테스트는 고정 순서를 주입한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/fair_pair_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace arena {

class RandomSource {
 public:
  virtual ~RandomSource() = default;
  // [0, count) 범위의 균등 인덱스. count는 1 이상이어야 한다.
  virtual std::size_t UniformIndex(std::size_t count) = 0;
};

class MtRandomSource : public RandomSource {
 public:
  // seed가 0이면 std::random_device로 시드를 만든다.
  explicit MtRandomSource(std::uint64_t seed = 0);

  std::size_t UniformIndex(std::size_t count) override;

 private:
  std::mt19937_64 gen_;
  std::mutex mutex_;
};

}  // namespace arena
