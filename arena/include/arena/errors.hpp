/*
 * 설명: 엔진 설정 오류와 사전조건 위반을 표현하는 예외 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/category_weights_test.cpp, arena/tests/unit/rating_update_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace arena {

// 가중치/설정 값이 잘못된 경우. 보정하지 않고 생성 자체를 실패시킨다.
class ConfigurationError : public std::runtime_error {
 public:
  ConfigurationError(const std::string& code, const std::string& message)
      : std::runtime_error(message), code(code) {}
  std::string code;
};

// 호출자가 계약을 어긴 경우(자기 자신과의 비교, 열거 밖 판정 값 등).
class PreconditionViolation : public std::runtime_error {
 public:
  PreconditionViolation(const std::string& code, const std::string& message)
      : std::runtime_error(message), code(code) {}
  std::string code;
};

}  // namespace arena
