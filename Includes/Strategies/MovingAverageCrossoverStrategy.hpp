#pragma once

// 내부 헤더
#include "Engines/Strategy.hpp"

namespace tradesim::strategy {

/**
 * 단기, 장기 이동 평균 교차 전략
 *
 * 단기 이동 평균이 장기 이동 평균을 상향 교차하면 매수한다.
 * 매도는 롱 청산이며 수익일 때만 청산된다.
 *
 * SMA_CROSSOVER → 단순 이동 평균, 하향 교차한 바에서만 매도, 1 단위 고정
 *                 수량을 현금에서 차감\n
 * EMA_CROSSOVER → 지수 이동 평균, 단기가 장기 아래에 있는 동안 매도,
 *                 ATR은 손절 없이 수량 계산에만 사용
 */
class MovingAverageCrossoverStrategy final : public Strategy {
 public:
  MovingAverageCrossoverStrategy(const StrategyConfig& config,
                                 shared_ptr<Logger> logger);
  ~MovingAverageCrossoverStrategy() override;

  void Initialize(IndicatorEngine& indicators) const override;

  /// EMA 계열만 ATR을 사용
  [[nodiscard]] string GetAtrSeriesName() const override;

 private:
  bool is_exponential_;
};

}  // namespace tradesim::strategy
