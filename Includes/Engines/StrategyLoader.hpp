#pragma once

// 표준 라이브러리
#include <memory>

// 내부 헤더
#include "Engines/Strategy.hpp"

// 네임 스페이스
using namespace std;

namespace tradesim::strategy {

/**
 * 전략 설정의 계열에 맞는 전략을 생성하는 함수
 *
 * @param config 전략 설정
 * @param logger 전략이 사용할 로거
 * @return 생성된 전략
 */
[[nodiscard]] shared_ptr<Strategy> LoadStrategy(const StrategyConfig& config,
                                                shared_ptr<Logger> logger);

}  // namespace tradesim::strategy
