/*
 * 설명: mt19937 기반 기본 난수원을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "arena/random_source.hpp"

#include "arena/errors.hpp"

namespace arena {
namespace {
std::uint64_t ResolveSeed(std::uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}
}  // namespace

MtRandomSource::MtRandomSource(std::uint64_t seed) : gen_(ResolveSeed(seed)) {}

std::size_t MtRandomSource::UniformIndex(std::size_t count) {
  if (count == 0) {
    throw PreconditionViolation("empty_choice", "빈 집합에서 선택할 수 없습니다");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::uniform_int_distribution<std::size_t> dist(0, count - 1);
  return dist(gen_);
}

}  // namespace arena
