// 표준 라이브러리
#include <algorithm>
#include <cmath>

// 파일 헤더
#include "Indicators/Highest.hpp"

namespace tradesim::indicator {

Highest::Highest(const string& name, Indicator& source, const size_t period,
                 const WindowPolicy policy, const size_t shift)
    : Indicator(name),
      source_(source),
      period_(period),
      policy_(policy),
      shift_(shift) {
  ValidatePeriod(name, period);
  values_.reserve(period);
}

void Highest::Initialize() { values_.clear(); }

double Highest::Calculate() {
  if (!CollectWindow(source_, period_, shift_, policy_, values_)) {
    return nan("");
  }

  return *max_element(values_.begin(), values_.end());
}

}  // namespace tradesim::indicator
