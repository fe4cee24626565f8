// 표준 라이브러리
#include <cmath>

// 파일 헤더
#include "Indicators/SimpleAverageTrueRange.hpp"

// 내부 헤더
#include "Indicators/TrueRange.hpp"

namespace tradesim::indicator {

SimpleAverageTrueRange::SimpleAverageTrueRange(const string& name,
                                               const size_t period,
                                               const WindowPolicy policy)
    : Indicator(name),
      policy_(policy),
      window_((ValidatePeriod(name, period), period)),
      prev_close_(nan("")) {}

void SimpleAverageTrueRange::Initialize() {
  window_.Reset();
  prev_close_ = nan("");
}

double SimpleAverageTrueRange::Calculate() {
  const auto& current_bar = GetCurrentBar();

  window_.Push(TrueRange::CalculateTrueRange(current_bar, prev_close_));
  prev_close_ = current_bar.close;

  return window_.GetMean(policy_);
}

}  // namespace tradesim::indicator
