// 표준 라이브러리
#include <algorithm>
#include <cmath>

// 파일 헤더
#include "Indicators/Lowest.hpp"

namespace tradesim::indicator {

Lowest::Lowest(const string& name, Indicator& source, const size_t period,
               const WindowPolicy policy, const size_t shift)
    : Indicator(name),
      source_(source),
      period_(period),
      policy_(policy),
      shift_(shift) {
  ValidatePeriod(name, period);
  values_.reserve(period);
}

void Lowest::Initialize() { values_.clear(); }

double Lowest::Calculate() {
  if (!CollectWindow(source_, period_, shift_, policy_, values_)) {
    return nan("");
  }

  return *min_element(values_.begin(), values_.end());
}

}  // namespace tradesim::indicator
