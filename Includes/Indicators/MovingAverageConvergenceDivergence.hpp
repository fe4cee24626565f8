#pragma once

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// MACD 라인 (fast EMA - slow EMA).\n
/// 시그널 라인은 이 지표를 소스로 하는 ExponentialMovingAverage로 추가
class MovingAverageConvergenceDivergence final : public Indicator {
 public:
  explicit MovingAverageConvergenceDivergence(const string& name,
                                              Indicator& source,
                                              size_t fast_span,
                                              size_t slow_span);

 private:
  Indicator& source_;
  double fast_alpha_;
  double slow_alpha_;
  double fast_ema_;
  double slow_ema_;

  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
