/*
 * 설명: 아레나 서버 환경설정 로딩과 기본값, Elo 설정 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: arena/tests/unit/config_test.cpp, arena/tests/e2e/arena_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "arena/rating_engine.hpp"

namespace arena {

struct ArenaConfig {
  unsigned short port;
  std::string vote_store;
  std::string votes_path;
  std::string papers_path;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  double k_factor;
  double initial_rating;
  double weight_technical_quality;
  double weight_constructiveness;
  double weight_clarity;
  double weight_overall_quality;
  double fair_match_step;
  std::size_t fair_pair_max_attempts;
  std::uint64_t random_seed;
};

// 숫자 형식이 잘못된 값은 ConfigurationError.
ArenaConfig LoadConfigFromEnv();

// 가중치 합/범위 검증을 포함한다.
EloSettings BuildEloSettings(const ArenaConfig& config);

}  // namespace arena
