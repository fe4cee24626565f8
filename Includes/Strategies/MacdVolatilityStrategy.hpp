#pragma once

// 내부 헤더
#include "Engines/Strategy.hpp"

namespace tradesim::strategy {

/**
 * MACD 방향, SMA 추세, 변동성 필터를 결합한 전략
 *
 * 변동성은 채널 기간의 최고가 - 최저가이며, 그 중앙값보다 클 때만 신호가
 * 발생한다.
 *
 * 매수: MACD > 시그널, 종가 > 빠른 SMA, 빠른 SMA > 느린 SMA\n
 * 매도: MACD <= 시그널, 종가 < 빠른 SMA, 빠른 SMA < 느린 SMA
 */
class MacdVolatilityStrategy final : public Strategy {
 public:
  MacdVolatilityStrategy(const StrategyConfig& config,
                         shared_ptr<Logger> logger);
  ~MacdVolatilityStrategy() override;

  void Initialize(IndicatorEngine& indicators) const override;
};

}  // namespace tradesim::strategy
