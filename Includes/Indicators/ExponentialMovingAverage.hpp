#pragma once

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// 지수 이동평균 (EMA).\n
/// 가중치는 2 / (span + 1)이며 첫 유한 관측값으로 시드한다.
class ExponentialMovingAverage final : public Indicator {
 public:
  explicit ExponentialMovingAverage(const string& name, Indicator& source,
                                    size_t span);

 private:
  Indicator& source_;
  double alpha_;  // EMA 가중치
  double prev_;   // 직전 EMA 값

  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
