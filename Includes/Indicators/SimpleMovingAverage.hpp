#pragma once

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// 단순 이동평균 (SMA)
class SimpleMovingAverage final : public Indicator {
 public:
  explicit SimpleMovingAverage(const string& name, Indicator& source,
                               size_t period, WindowPolicy policy = FULL);

 private:
  Indicator& source_;
  WindowPolicy policy_;
  RollingWindow window_;

  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
