#pragma once

// 내부 헤더
#include "Engines/Strategy.hpp"

namespace tradesim::strategy {

/**
 * Donchian 채널 돌파 전략
 *
 * 종가가 진입 채널 상단을 돌파하고 변동성, 추세, 모멘텀 필터를 모두
 * 통과하면 매수, 종가가 청산 채널 하단 아래로 내려가면 매도한다.
 *
 * DONCHIAN → 이전 바들만으로 계산한 채널(가득 찬 윈도우), 매도는 숏 진입\n
 * DONCHIAN_ATR → 부분 윈도우 채널, 매도는 롱 청산\n
 * sma_trend_period가 0이면 추세 필터를 사용하지 않는다.
 */
class DonchianStrategy final : public Strategy {
 public:
  DonchianStrategy(const StrategyConfig& config, shared_ptr<Logger> logger);
  ~DonchianStrategy() override;

  void Initialize(IndicatorEngine& indicators) const override;
};

}  // namespace tradesim::strategy
