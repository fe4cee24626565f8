// 표준 라이브러리
#include <algorithm>
#include <cmath>

// 파일 헤더
#include "Indicators/TrueRange.hpp"

namespace tradesim::indicator {

TrueRange::TrueRange(const string& name)
    : Indicator(name), prev_close_(nan("")) {}

double TrueRange::CalculateTrueRange(const Bar& bar,
                                     const double prev_close) {
  const double hl = bar.high - bar.low;

  // 첫 번째 바: TR = high - low
  if (isnan(prev_close)) {
    return hl;
  }

  const double hc = abs(bar.high - prev_close);
  const double lc = abs(bar.low - prev_close);

  return max({hl, hc, lc});
}

void TrueRange::Initialize() { prev_close_ = nan(""); }

double TrueRange::Calculate() {
  const auto& current_bar = GetCurrentBar();
  const double true_range = CalculateTrueRange(current_bar, prev_close_);

  prev_close_ = current_bar.close;
  return true_range;
}

}  // namespace tradesim::indicator
