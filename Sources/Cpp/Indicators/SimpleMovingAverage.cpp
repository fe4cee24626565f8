// 파일 헤더
#include "Indicators/SimpleMovingAverage.hpp"

namespace tradesim::indicator {

SimpleMovingAverage::SimpleMovingAverage(const string& name,
                                         Indicator& source, const size_t period,
                                         const WindowPolicy policy)
    : Indicator(name),
      source_(source),
      policy_(policy),
      window_((ValidatePeriod(name, period), period)) {}

void SimpleMovingAverage::Initialize() { window_.Reset(); }

double SimpleMovingAverage::Calculate() {
  window_.Push(source_[0]);
  return window_.GetMean(policy_);
}

}  // namespace tradesim::indicator
