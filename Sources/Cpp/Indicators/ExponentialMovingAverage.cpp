// 표준 라이브러리
#include <cmath>

// 파일 헤더
#include "Indicators/ExponentialMovingAverage.hpp"

namespace tradesim::indicator {

ExponentialMovingAverage::ExponentialMovingAverage(const string& name,
                                                   Indicator& source,
                                                   const size_t span)
    : Indicator(name), source_(source), alpha_(0.0), prev_(nan("")) {
  ValidatePeriod(name, span);
  alpha_ = 2.0 / (static_cast<double>(span) + 1.0);
}

void ExponentialMovingAverage::Initialize() { prev_ = nan(""); }

double ExponentialMovingAverage::Calculate() {
  const double value = source_[0];

  // 소스가 정의되지 않은 바는 직전 값을 유지
  if (!isfinite(value)) {
    return prev_;
  }

  if (isnan(prev_)) {
    prev_ = value;
    return prev_;
  }

  prev_ = alpha_ * value + (1.0 - alpha_) * prev_;
  return prev_;
}

}  // namespace tradesim::indicator
