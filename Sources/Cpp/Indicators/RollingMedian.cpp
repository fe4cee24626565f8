// 표준 라이브러리
#include <algorithm>
#include <cmath>

// 파일 헤더
#include "Indicators/RollingMedian.hpp"

namespace tradesim::indicator {

RollingMedian::RollingMedian(const string& name, Indicator& source,
                             const size_t period, const WindowPolicy policy)
    : Indicator(name), source_(source), period_(period), policy_(policy) {
  ValidatePeriod(name, period);
  values_.reserve(period);
}

void RollingMedian::Initialize() { values_.clear(); }

double RollingMedian::Calculate() {
  if (!CollectWindow(source_, period_, 0, policy_, values_)) {
    return nan("");
  }

  const size_t mid = values_.size() / 2;
  nth_element(values_.begin(), values_.begin() + static_cast<ptrdiff_t>(mid),
              values_.end());
  const double upper = values_[mid];

  if (values_.size() % 2 == 1) {
    return upper;
  }

  // 짝수 개면 가운데 두 값의 평균
  const double lower =
      *max_element(values_.begin(), values_.begin() + static_cast<ptrdiff_t>(mid));
  return (lower + upper) / 2.0;
}

}  // namespace tradesim::indicator
