#pragma once

// 내부 헤더
#include "Engines/Strategy.hpp"

namespace tradesim::strategy {

/**
 * 가격과 SMA의 위치로 매매하는 전략
 *
 * 저가가 SMA 위로 새로 올라선 바에서 현금의 일정 비율만큼 매수하고,
 * 고가가 SMA 아래에 있고 수익률이 기준 이상일 때 전량 매도한다.
 *
 * 자산은 신호를 처리하기 전에 기록하므로 자체 실행 경로를 사용한다.
 */
class SmaThresholdStrategy final : public Strategy {
 public:
  SmaThresholdStrategy(const StrategyConfig& config, shared_ptr<Logger> logger);
  ~SmaThresholdStrategy() override;

  void Initialize(IndicatorEngine& indicators) const override;

  /// 바마다 자산을 먼저 기록한 뒤 신호를 처리하는 실행 경로
  void Backtest(const BarData& bars, const IndicatorEngine& indicators,
                const vector<Signal>& signals, PositionManager& manager,
                RunContext& context) const override;

  [[nodiscard]] RunMode GetRunMode() const override;

  /// ATR을 사용하지 않음
  [[nodiscard]] string GetAtrSeriesName() const override;
};

}  // namespace tradesim::strategy
